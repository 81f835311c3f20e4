#pragma once

// ============================================================
// transfer_engine.hpp -- TCP file offers, chunk streaming, verification
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/config.hpp"
#include "../common/socket.hpp"
#include "admission_gate.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

enum class JobDirection {
    SEND,
    RECEIVE,
};

enum class JobState {
    OFFERED,
    ACCEPTED,
    IN_PROGRESS,
    COMPLETED,
    REJECTED,
    FAILED,
    CANCELLED,
};

inline bool is_terminal(JobState s) {
    return s == JobState::COMPLETED || s == JobState::REJECTED ||
           s == JobState::FAILED    || s == JobState::CANCELLED;
}

const char* job_state_name(JobState s);

struct TransferJobInfo {
    u64                        job_id{0};
    JobDirection               direction{JobDirection::SEND};
    u64                        peer_id{0};
    std::string                peer_name;
    std::string                peer_ip;
    u16                        peer_port{0};
    std::vector<TransferEntry> entries;
    bool                       bundled{false};
    JobState                   state{JobState::OFFERED};
    u64                        bytes_done{0};
    u64                        total_bytes{0};
    std::vector<std::string>   destinations;  // final paths (receive, completed)
    TransferError              error{TransferError::NONE};
};

struct TransferCallbacks {
    // A peer offered files; answer with accept() / reject()
    std::function<void(const TransferJobInfo&)>          on_incoming_offer;
    std::function<void(u64 job_id, u64 done, u64 total)> on_progress;
    // Every state change after creation, terminal ones exactly once
    std::function<void(const TransferJobInfo&)>          on_state_changed;
};

// Job outcome carried through a worker's call stack
class TransferFailure : public std::runtime_error {
public:
    TransferFailure(TransferError err, const std::string& what)
        : std::runtime_error(what), error_(err) {}
    TransferError error() const { return error_; }
private:
    TransferError error_;
};

class TransferEngine {
public:
    TransferEngine(const LanConfig& cfg, u64 node_id);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void set_callbacks(TransferCallbacks cb);

    // Bind the listener and start accepting offers. Throws on bind failure.
    void start();

    // Cancel every job and join all workers
    void stop();

    // Actual listening port (useful when configured as 0)
    u16 listen_port() const { return listen_port_; }

    // Offer `paths` to the peer. Throws std::invalid_argument when a path
    // is not a regular file, std::runtime_error when stopped.
    u64 offer(const std::string& peer_ip, u16 peer_port,
              const std::vector<std::string>& paths,
              u64 peer_id = 0, const std::string& peer_name = "");

    // Answer an incoming offer. False if the job is unknown or already decided.
    bool accept(u64 job_id);
    bool reject(u64 job_id);

    // Request cancellation; false for unknown / finished jobs
    bool cancel(u64 job_id);

    // Active (non-terminal) jobs
    std::vector<TransferJobInfo> jobs() const;
    bool job_info(u64 job_id, TransferJobInfo& out) const;

    // Bundling admission shared by every outgoing multi-file offer
    AdmissionGate& gate() { return gate_; }
    const AdmissionGate& gate() const { return gate_; }

private:
    enum class Decision { PENDING, ACCEPT, REJECT };

    struct Job {
        TransferJobInfo          info;        // guarded by mutex_
        Decision                 decision{Decision::PENDING};
        bool                     finished{false};
        std::atomic<bool>        cancel{false};
        std::vector<std::string> paths;       // send side sources
        u64                      last_progress_ms{0};
    };

    struct Worker {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void launch(std::function<void()> fn);
    void reap_workers();

    void run_send(std::shared_ptr<Job> job);
    void run_receive(std::shared_ptr<TcpSocket> sock);

    TcpSocket connect_with_retry(Job& job);
    bool next_frame(TcpSocket& sock, const std::atomic<bool>& cancel,
                    u64 deadline_ms, Frame& out);
    void stream_file(TcpSocket& sock, Job& job, const std::string& path, bool compressible);
    void receive_stream(TcpSocket& sock, Job& job, const TransferOfferFrame& offer,
                        const std::string& part_path);
    std::vector<std::string> deliver(Job& job, const TransferOfferFrame& offer,
                                     const std::string& part_path,
                                     std::vector<std::string>& temp_files);

    void set_state(Job& job, JobState state);
    void finish(Job& job, JobState state, TransferError err = TransferError::NONE);
    void report_progress(Job& job, u64 done, bool force);
    void send_quietly(TcpSocket& sock, const Frame& f);
    void send_cancel(TcpSocket& sock, u64 job_id);

    std::string temp_path(const char* prefix, u64 job_id, const char* suffix) const;

    LanConfig         cfg_;
    u64               node_id_;
    TransferCallbacks cb_;
    AdmissionGate     gate_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    TcpSocket         listener_{INVALID_SOCKET_VAL};
    u16               listen_port_{0};
    std::thread       accept_thread_;

    mutable std::mutex                      mutex_;
    std::condition_variable                 decision_cv_;
    std::map<u64, std::shared_ptr<Job>>     jobs_;

    std::mutex          workers_mutex_;
    std::vector<Worker> workers_;
};
