// ============================================================
// transfer_engine.cpp -- Offer / accept / stream / verify
// ============================================================

#include "transfer_engine.hpp"
#include "bundle_builder.hpp"
#include "../common/codec.hpp"
#include "../common/compress.hpp"
#include "../common/crypto.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>

// Socket poll period; bounds how long a cancel takes to be noticed
static constexpr int POLL_MS = 200;
// A connecting peer must send its offer within this window
static constexpr u64 OFFER_READ_TIMEOUT_MS = 10000;
// Extra time the sender waits beyond the receiver's decision window
static constexpr u64 DECISION_GRACE_MS = 5000;
// How long a cancelling side keeps draining before it closes
static constexpr u64 CANCEL_LINGER_MS = 2000;

const char* job_state_name(JobState s) {
    switch (s) {
        case JobState::OFFERED:     return "offered";
        case JobState::ACCEPTED:    return "accepted";
        case JobState::IN_PROGRESS: return "in_progress";
        case JobState::COMPLETED:   return "completed";
        case JobState::REJECTED:    return "rejected";
        case JobState::FAILED:      return "failed";
        case JobState::CANCELLED:   return "cancelled";
    }
    return "?";
}

// Run a file-system step; any failure becomes a DISK_ERROR outcome
template<typename F>
static auto disk_op(const std::string& what, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const TransferFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw TransferFailure(TransferError::DISK_ERROR, what + ": " + e.what());
    }
}

// Thrown inside a worker when the job's cancel flag is seen
struct JobCancelled {
    bool by_peer;
};

// ============================================================
// Lifecycle
// ============================================================

TransferEngine::TransferEngine(const LanConfig& cfg, u64 node_id)
    : cfg_(cfg)
    , node_id_(node_id)
    , gate_((size_t)std::max(1, cfg.bundle_slots))
{}

TransferEngine::~TransferEngine() {
    stop();
}

void TransferEngine::set_callbacks(TransferCallbacks cb) {
    cb_ = std::move(cb);
}

void TransferEngine::start() {
    if (running_) return;

    std::error_code ec;
    fs::create_directories(cfg_.effective_temp_dir(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create temp dir " + cfg_.effective_temp_dir() +
                                 ": " + ec.message());
    }

    TcpSocket listener;
    listener.bind_and_listen(cfg_.transfer_bind_ip, cfg_.transfer_port);
    listen_port_ = listener.local_port();
    listener_ = std::move(listener);

    stopping_ = false;
    running_  = true;
    accept_thread_ = std::thread([this] { accept_loop(); });
    LOG_INFO("Transfer listener on " + cfg_.transfer_bind_ip + ":" + std::to_string(listen_port_));
}

void TransferEngine::stop() {
    if (!running_.exchange(false)) return;
    stopping_ = true;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& kv : jobs_) kv.second->cancel = true;
    }
    decision_cv_.notify_all();

    if (accept_thread_.joinable()) accept_thread_.join();
    listener_.close();

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }

    std::lock_guard<std::mutex> lk(mutex_);
    jobs_.clear();
}

void TransferEngine::launch(std::function<void()> fn) {
    reap_workers();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread t([fn = std::move(fn), done]() {
        fn();
        *done = true;
    });
    std::lock_guard<std::mutex> lk(workers_mutex_);
    workers_.push_back(Worker{std::move(t), done});
}

void TransferEngine::reap_workers() {
    std::lock_guard<std::mutex> lk(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (*it->done) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TransferEngine::accept_loop() {
    while (running_) {
        int rc = listener_.wait_readable(POLL_MS);
        if (rc <= 0) continue;
        try {
            auto sock = std::make_shared<TcpSocket>(listener_.accept());
            sock->set_recv_timeout_ms(cfg_.stall_timeout_ms);
            LOG_DEBUG("Transfer connection from " + sock->peer_addr());
            launch([this, sock] { run_receive(sock); });
        } catch (const std::exception& e) {
            if (running_) LOG_WARN(std::string("Accept failed: ") + e.what());
        }
    }
}

// ============================================================
// Job bookkeeping
// ============================================================

std::string TransferEngine::temp_path(const char* prefix, u64 job_id, const char* suffix) const {
    return (fs::path(cfg_.effective_temp_dir()) /
            (std::string(prefix) + utils::to_hex(job_id) + suffix)).string();
}

void TransferEngine::set_state(Job& job, JobState state) {
    TransferJobInfo info;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (job.finished || job.info.state == state) return;
        job.info.state = state;
        info = job.info;
    }
    LOG_DEBUG("Job " + utils::to_hex(info.job_id) + " -> " + job_state_name(state));
    if (cb_.on_state_changed) cb_.on_state_changed(info);
}

void TransferEngine::finish(Job& job, JobState state, TransferError err) {
    TransferJobInfo info;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (job.finished) return;
        job.finished   = true;
        job.info.state = state;
        job.info.error = err;
        info = job.info;
        jobs_.erase(info.job_id);
    }

    std::string msg = "Job " + utils::to_hex(info.job_id) + " " + job_state_name(state);
    if (state == JobState::FAILED) {
        LOG_WARN(msg + " (" + transfer_error_name(err) + ")");
    } else {
        LOG_INFO(msg);
    }
    if (cb_.on_state_changed) cb_.on_state_changed(info);
}

void TransferEngine::report_progress(Job& job, u64 done, bool force) {
    u64 now = utils::steady_ms();
    u64 total;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        job.info.bytes_done = done;
        total = job.info.total_bytes;
    }
    if (!force && now - job.last_progress_ms < (u64)cfg_.progress_interval_ms) return;
    job.last_progress_ms = now;
    if (cb_.on_progress) cb_.on_progress(job.info.job_id, done, total);
}

void TransferEngine::send_quietly(TcpSocket& sock, const Frame& f) {
    try {
        sock.write_frame(f);
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("Final frame not delivered: ") + e.what());
    }
}

// Tell the peer we cancelled, then discard what it still has in flight
// until it closes. Unread data at close resets the connection before the
// peer has read the cancel.
void TransferEngine::send_cancel(TcpSocket& sock, u64 job_id) {
    send_quietly(sock, TransferCancelFrame{job_id});
    sock.shutdown_send();

    u64 deadline = utils::steady_ms() + CANCEL_LINGER_MS;
    while (utils::steady_ms() < deadline) {
        int rc = sock.wait_readable(POLL_MS);
        if (rc < 0) return;
        if (rc == 0) continue;
        try {
            Frame f;
            if (!sock.read_frame(f)) return;
        } catch (const std::exception& e) {
            LOG_DEBUG(std::string("Drain after cancel ended: ") + e.what());
            return;
        }
    }
}

std::vector<TransferJobInfo> TransferEngine::jobs() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<TransferJobInfo> out;
    out.reserve(jobs_.size());
    for (auto& kv : jobs_) out.push_back(kv.second->info);
    return out;
}

bool TransferEngine::job_info(u64 job_id, TransferJobInfo& out) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return false;
    out = it->second->info;
    return true;
}

// ============================================================
// Control API
// ============================================================

u64 TransferEngine::offer(const std::string& peer_ip, u16 peer_port,
                          const std::vector<std::string>& paths,
                          u64 peer_id, const std::string& peer_name) {
    if (!running_) throw std::runtime_error("Transfer engine not running");
    if (paths.empty()) throw std::invalid_argument("Nothing to send");
    if (paths.size() > 0xFFFF) throw std::invalid_argument("Too many files in one offer");

    auto job = std::make_shared<Job>();
    job->paths = paths;
    job->info.job_id    = crypto::random_id();
    job->info.direction = JobDirection::SEND;
    job->info.peer_id   = peer_id;
    job->info.peer_name = peer_name;
    job->info.peer_ip   = peer_ip;
    job->info.peer_port = peer_port;
    job->info.bundled   = paths.size() > 1;
    job->info.state     = JobState::OFFERED;

    for (auto& p : paths) {
        if (!file_io::is_regular_file(p)) {
            throw std::invalid_argument("Not a regular file: " + p);
        }
        TransferEntry e;
        e.name = fs::path(p).filename().string();
        e.size = file_io::get_file_size(p);
        job->info.entries.push_back(e);
        job->info.total_bytes += e.size;
    }

    TransferJobInfo info = job->info;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        jobs_[info.job_id] = job;
    }
    LOG_INFO("Offering " + std::to_string(paths.size()) + " file(s), " +
             utils::format_bytes(info.total_bytes) + " to " + peer_ip + ":" +
             std::to_string(peer_port) + " (job " + utils::to_hex(info.job_id) + ")");
    if (cb_.on_state_changed) cb_.on_state_changed(info);

    launch([this, job] { run_send(job); });
    return info.job_id;
}

bool TransferEngine::accept(u64 job_id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return false;
    Job& job = *it->second;
    if (job.info.direction != JobDirection::RECEIVE || job.decision != Decision::PENDING) return false;
    job.decision = Decision::ACCEPT;
    decision_cv_.notify_all();
    return true;
}

bool TransferEngine::reject(u64 job_id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return false;
    Job& job = *it->second;
    if (job.info.direction != JobDirection::RECEIVE || job.decision != Decision::PENDING) return false;
    job.decision = Decision::REJECT;
    decision_cv_.notify_all();
    return true;
}

bool TransferEngine::cancel(u64 job_id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return false;
    it->second->cancel = true;
    decision_cv_.notify_all();
    return true;
}

// ============================================================
// Socket helpers
// ============================================================

TcpSocket TransferEngine::connect_with_retry(Job& job) {
    std::string last_error;
    for (int attempt = 1; attempt <= cfg_.connect_attempts; ++attempt) {
        if (job.cancel) throw JobCancelled{false};
        try {
            TcpSocket sock;
            sock.connect(job.info.peer_ip, job.info.peer_port);
            sock.set_recv_timeout_ms(cfg_.stall_timeout_ms);
            return sock;
        } catch (const std::exception& e) {
            last_error = e.what();
            LOG_DEBUG("Connect attempt " + std::to_string(attempt) + " to " + job.info.peer_ip +
                      " failed: " + last_error);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.connect_retry_ms));
    }
    throw TransferFailure(TransferError::CONNECTION_LOST,
                          "Cannot reach " + job.info.peer_ip + ":" +
                          std::to_string(job.info.peer_port) + ": " + last_error);
}

// Wait for the next frame while honouring `cancel` and an optional deadline
// (0 = none). Returns false on cancel; throws TransferFailure on close,
// error or deadline.
bool TransferEngine::next_frame(TcpSocket& sock, const std::atomic<bool>& cancel,
                                u64 deadline_ms, Frame& out) {
    while (true) {
        if (cancel) return false;
        int rc = sock.wait_readable(POLL_MS);
        if (rc < 0) {
            throw TransferFailure(TransferError::CONNECTION_LOST, "poll failed");
        }
        if (rc == 0) {
            if (deadline_ms && utils::steady_ms() >= deadline_ms) {
                throw TransferFailure(TransferError::CONNECTION_LOST, "peer timed out");
            }
            continue;
        }
        try {
            if (!sock.read_frame(out)) {
                throw TransferFailure(TransferError::CONNECTION_LOST, "peer closed the connection");
            }
        } catch (const TransferFailure&) {
            throw;
        } catch (const std::exception& e) {
            throw TransferFailure(TransferError::CONNECTION_LOST, e.what());
        }
        return true;
    }
}

// ============================================================
// Sender
// ============================================================

void TransferEngine::run_send(std::shared_ptr<Job> job) {
    const u64 id = job->info.job_id;
    std::string archive_path;

    try {
        // 1. Prepare the byte stream and its checksums
        TransferOfferFrame offer;
        offer.job_id      = id;
        offer.sender_id   = node_id_;
        offer.sender_name = cfg_.display_name;
        offer.bundled     = job->paths.size() > 1 ? 1 : 0;

        std::string stream_path;
        bool compressible = true;

        if (offer.bundled) {
            AdmissionGate::Slot slot(gate_, job->cancel);
            if (!slot.held()) throw JobCancelled{false};

            BundleBuilder builder;
            archive_path = temp_path("send-", id, ".bundle");
            bool built = disk_op("bundling", [&] {
                builder.build(job->paths);
                return builder.write_archive(archive_path, job->cancel);
            });
            if (!built) throw JobCancelled{false};

            offer.entries         = builder.entries();
            offer.total_size      = builder.total_size();
            offer.stream_xxh3_128 = builder.stream_hash();
            stream_path = archive_path;
        } else {
            const std::string& src = job->paths.front();
            TransferEntry e;
            e.name = fs::path(src).filename().string();
            e.size = file_io::get_file_size(src);
            bool hashed = disk_op("hashing " + src, [&] {
                return hash_file(src, job->cancel, e.xxh3_128);
            });
            if (!hashed) throw JobCancelled{false};

            offer.entries.push_back(e);
            offer.total_size      = e.size;
            offer.stream_xxh3_128 = e.xxh3_128;
            stream_path  = src;
            compressible = compress::should_compress(src);
        }

        {
            std::lock_guard<std::mutex> lk(mutex_);
            job->info.entries     = offer.entries;
            job->info.total_bytes = offer.total_size;
        }

        // 2. Connect and offer
        TcpSocket sock = connect_with_retry(*job);
        try {
            sock.write_frame(offer);
        } catch (const std::exception& e) {
            throw TransferFailure(TransferError::CONNECTION_LOST, e.what());
        }

        // 3. Wait for the receiver's decision
        Frame f;
        u64 deadline = utils::steady_ms() + (u64)cfg_.offer_timeout_ms + DECISION_GRACE_MS;
        while (true) {
            if (!next_frame(sock, job->cancel, deadline, f)) {
                send_cancel(sock, id);
                throw JobCancelled{false};
            }
            if (std::holds_alternative<TransferCancelFrame>(f)) throw JobCancelled{true};
            if (auto* ack = std::get_if<TransferAckFrame>(&f)) {
                if (ack->status == AckStatus::AS_REJECTED) {
                    finish(*job, JobState::REJECTED);
                    break;
                }
                if (ack->status == AckStatus::AS_ACCEPTED) break;
            }
            LOG_DEBUG("Job " + utils::to_hex(id) + ": unexpected frame while awaiting decision");
        }
        if (job->finished) {
            if (!archive_path.empty()) file_io::remove_quietly(archive_path);
            return;
        }

        set_state(*job, JobState::ACCEPTED);
        set_state(*job, JobState::IN_PROGRESS);

        // 4. Stream chunks
        stream_file(sock, *job, stream_path, compressible);

        // 5. Wait for the verdict
        deadline = utils::steady_ms() + (u64)cfg_.offer_timeout_ms;
        while (true) {
            if (!next_frame(sock, job->cancel, deadline, f)) {
                send_cancel(sock, id);
                throw JobCancelled{false};
            }
            if (std::holds_alternative<TransferCancelFrame>(f)) throw JobCancelled{true};
            if (auto* ack = std::get_if<TransferAckFrame>(&f)) {
                if (ack->status == AckStatus::AS_COMPLETED) {
                    finish(*job, JobState::COMPLETED);
                    break;
                }
                if (ack->status == AckStatus::AS_FAILED) {
                    throw TransferFailure(ack->error == TransferError::NONE
                                              ? TransferError::CONNECTION_LOST : ack->error,
                                          "receiver reported failure");
                }
            }
        }
    } catch (const JobCancelled& c) {
        LOG_INFO("Job " + utils::to_hex(id) + " cancelled" + (c.by_peer ? " by peer" : ""));
        finish(*job, JobState::CANCELLED);
    } catch (const TransferFailure& e) {
        LOG_WARN("Job " + utils::to_hex(id) + ": " + e.what());
        finish(*job, JobState::FAILED, e.error());
    } catch (const std::exception& e) {
        LOG_ERROR("Job " + utils::to_hex(id) + ": " + e.what());
        finish(*job, JobState::FAILED, TransferError::CONNECTION_LOST);
    }

    if (!archive_path.empty()) file_io::remove_quietly(archive_path);
}

void TransferEngine::stream_file(TcpSocket& sock, Job& job, const std::string& path,
                                 bool compressible) {
    const u64 id = job.info.job_id;
    std::unique_ptr<file_io::MmapReader> reader = disk_op("opening " + path, [&] {
        return std::make_unique<file_io::MmapReader>(path);
    });

    const u64 total = reader->size();
    if (total != job.info.total_bytes) {
        throw TransferFailure(TransferError::DISK_ERROR, "Source changed size: " + path);
    }
    bool use_compress = cfg_.use_compress && compressible;

    u64 sent = 0;
    report_progress(job, 0, true);
    while (sent < total) {
        if (job.cancel) {
            send_cancel(sock, id);
            throw JobCancelled{false};
        }

        // The receiver may abort mid-stream
        if (sock.wait_readable(0) > 0) {
            Frame f;
            bool got = false;
            try {
                got = sock.read_frame(f);
            } catch (const std::exception& e) {
                throw TransferFailure(TransferError::CONNECTION_LOST, e.what());
            }
            if (!got) throw TransferFailure(TransferError::CONNECTION_LOST, "peer closed the connection");
            if (std::holds_alternative<TransferCancelFrame>(f)) throw JobCancelled{true};
            if (auto* ack = std::get_if<TransferAckFrame>(&f)) {
                if (ack->status == AckStatus::AS_FAILED) {
                    throw TransferFailure(ack->error, "receiver aborted");
                }
            }
        }

        u64 n = reader->chunk_len(sent, cfg_.chunk_size);
        const char* src = reader->chunk_ptr(sent);

        TransferChunkFrame chunk;
        chunk.job_id      = id;
        chunk.offset      = sent;
        chunk.raw_len     = (u32)n;
        chunk.raw_xxh3_32 = hash::xxh3_32(src, (size_t)n);

        std::vector<u8> packed;
        if (use_compress) packed = compress::compress_if_smaller(src, (size_t)n);
        if (!packed.empty()) {
            chunk.compress_algo = CompressAlgo::ZSTD;
            chunk.data = std::move(packed);
        } else {
            chunk.compress_algo = CompressAlgo::NONE;
            chunk.data.assign(src, src + n);
        }

        try {
            sock.write_frame(chunk);
        } catch (const std::exception& e) {
            throw TransferFailure(TransferError::CONNECTION_LOST, e.what());
        }
        sent += n;
        report_progress(job, sent, sent == total);
    }
}

// ============================================================
// Receiver
// ============================================================

// Offers are checked before a job exists; a bad one just closes the socket
static bool validate_offer(const TransferOfferFrame& offer, std::string& why) {
    if (offer.job_id == 0) { why = "zero job id"; return false; }
    if (offer.entries.empty()) { why = "no entries"; return false; }
    if ((offer.bundled != 0) != (offer.entries.size() > 1)) { why = "bundled flag mismatch"; return false; }
    u64 sum = 0;
    for (auto& e : offer.entries) {
        std::string base;
        if (!file_io::safe_base_name(e.name, base)) {
            why = "unsafe file name '" + e.name + "'";
            return false;
        }
        sum += e.size;
    }
    if (sum != offer.total_size) { why = "entry sizes do not add up"; return false; }
    return true;
}

void TransferEngine::run_receive(std::shared_ptr<TcpSocket> sock) {
    // 1. Read and check the offer
    Frame f;
    TransferOfferFrame offer;
    try {
        if (!next_frame(*sock, stopping_, utils::steady_ms() + OFFER_READ_TIMEOUT_MS, f)) return;
    } catch (const std::exception& e) {
        LOG_WARN("No offer from " + sock->peer_addr() + ": " + e.what());
        return;
    }
    if (auto* o = std::get_if<TransferOfferFrame>(&f)) {
        offer = std::move(*o);
    } else {
        LOG_WARN("Expected TransferOffer from " + sock->peer_addr() + ", got " +
                 frame_type_name(codec::type_of(f)));
        return;
    }
    std::string why;
    if (!validate_offer(offer, why)) {
        LOG_WARN("Refusing malformed offer from " + sock->peer_addr() + ": " + why);
        return;
    }

    auto job = std::make_shared<Job>();
    job->info.job_id      = offer.job_id;
    job->info.direction   = JobDirection::RECEIVE;
    job->info.peer_id     = offer.sender_id;
    job->info.peer_name   = offer.sender_name;
    job->info.peer_ip     = sock->peer_ip();
    job->info.entries     = offer.entries;
    job->info.bundled     = offer.bundled != 0;
    job->info.state       = JobState::OFFERED;
    job->info.total_bytes = offer.total_size;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (jobs_.count(offer.job_id)) {
            LOG_WARN("Duplicate job id " + utils::to_hex(offer.job_id) + " from " + sock->peer_addr());
            return;
        }
        jobs_[offer.job_id] = job;
        if (stopping_) job->cancel = true;
    }
    LOG_INFO("Offer " + utils::to_hex(offer.job_id) + " from " + offer.sender_name + ": " +
             std::to_string(offer.entries.size()) + " file(s), " +
             utils::format_bytes(offer.total_size));
    if (cb_.on_incoming_offer) cb_.on_incoming_offer(job->info);

    const std::string part_path = temp_path("recv-", offer.job_id, ".part");
    std::vector<std::string> temp_files{part_path};

    try {
        // 2. Wait for the local decision, watching the sender meanwhile
        u64 deadline = utils::steady_ms() + (u64)cfg_.offer_timeout_ms;
        Decision decision = Decision::PENDING;
        while (true) {
            {
                std::unique_lock<std::mutex> lk(mutex_);
                decision_cv_.wait_for(lk, std::chrono::milliseconds(POLL_MS), [&] {
                    return job->decision != Decision::PENDING || job->cancel.load();
                });
                decision = job->decision;
            }
            if (job->cancel) {
                send_cancel(*sock, offer.job_id);
                throw JobCancelled{false};
            }
            if (decision != Decision::PENDING) break;
            if (utils::steady_ms() >= deadline) {
                LOG_INFO("Offer " + utils::to_hex(offer.job_id) + " timed out");
                decision = Decision::REJECT;
                break;
            }
            if (sock->wait_readable(0) > 0) {
                Frame g;
                bool got = false;
                try {
                    got = sock->read_frame(g);
                } catch (const std::exception& e) {
                    throw TransferFailure(TransferError::CONNECTION_LOST, e.what());
                }
                if (!got) throw TransferFailure(TransferError::CONNECTION_LOST, "sender went away");
                if (std::holds_alternative<TransferCancelFrame>(g)) throw JobCancelled{true};
            }
        }

        if (decision == Decision::REJECT) {
            send_quietly(*sock, TransferAckFrame{offer.job_id, AckStatus::AS_REJECTED, TransferError::NONE});
            finish(*job, JobState::REJECTED);
            return;
        }

        try {
            sock->write_frame(TransferAckFrame{offer.job_id, AckStatus::AS_ACCEPTED, TransferError::NONE});
        } catch (const std::exception& e) {
            throw TransferFailure(TransferError::CONNECTION_LOST, e.what());
        }
        set_state(*job, JobState::ACCEPTED);
        set_state(*job, JobState::IN_PROGRESS);

        // 3. Receive and verify
        receive_stream(*sock, *job, offer, part_path);
        std::vector<std::string> delivered = deliver(*job, offer, part_path, temp_files);

        {
            std::lock_guard<std::mutex> lk(mutex_);
            job->info.destinations = delivered;
        }
        send_quietly(*sock, TransferAckFrame{offer.job_id, AckStatus::AS_COMPLETED, TransferError::NONE});
        finish(*job, JobState::COMPLETED);
    } catch (const JobCancelled& c) {
        LOG_INFO("Job " + utils::to_hex(offer.job_id) + " cancelled" + (c.by_peer ? " by peer" : ""));
        finish(*job, JobState::CANCELLED);
    } catch (const TransferFailure& e) {
        LOG_WARN("Job " + utils::to_hex(offer.job_id) + ": " + e.what());
        if (e.error() != TransferError::CONNECTION_LOST) {
            send_quietly(*sock, TransferAckFrame{offer.job_id, AckStatus::AS_FAILED, e.error()});
        }
        finish(*job, JobState::FAILED, e.error());
    } catch (const std::exception& e) {
        LOG_ERROR("Job " + utils::to_hex(offer.job_id) + ": " + e.what());
        finish(*job, JobState::FAILED, TransferError::DISK_ERROR);
    }

    for (auto& t : temp_files) {
        std::error_code ec;
        if (fs::exists(t, ec)) file_io::remove_quietly(t);
    }
}

void TransferEngine::receive_stream(TcpSocket& sock, Job& job, const TransferOfferFrame& offer,
                                    const std::string& part_path) {
    const u64 id    = offer.job_id;
    const u64 total = offer.total_size;

    file_io::MmapWriter writer;
    disk_op("creating " + part_path, [&] { writer.open(part_path, total); });

    hash::StreamHasher128 stream;
    u64 received = 0;
    report_progress(job, 0, true);

    while (received < total) {
        Frame f;
        if (!next_frame(sock, job.cancel, 0, f)) {
            send_cancel(sock, id);
            throw JobCancelled{false};
        }
        if (std::holds_alternative<TransferCancelFrame>(f)) throw JobCancelled{true};

        auto* chunk = std::get_if<TransferChunkFrame>(&f);
        if (!chunk) {
            throw TransferFailure(TransferError::CONNECTION_LOST,
                                  std::string("unexpected ") + frame_type_name(codec::type_of(f)));
        }
        if (chunk->job_id != id || chunk->offset != received || chunk->raw_len == 0 ||
            chunk->raw_len > total - received) {
            throw TransferFailure(TransferError::CONNECTION_LOST,
                                  "chunk out of sequence at offset " + std::to_string(chunk->offset));
        }

        std::vector<u8> raw;
        const u8* data = chunk->data.data();
        if (chunk->compress_algo == CompressAlgo::ZSTD) {
            try {
                raw = compress::decompress_exact(chunk->data.data(), chunk->data.size(), chunk->raw_len);
            } catch (const std::exception& e) {
                throw TransferFailure(TransferError::CHECKSUM_MISMATCH, e.what());
            }
            data = raw.data();
        } else if (chunk->data.size() != chunk->raw_len) {
            throw TransferFailure(TransferError::CHECKSUM_MISMATCH, "chunk length mismatch");
        }

        if (hash::xxh3_32(data, chunk->raw_len) != chunk->raw_xxh3_32) {
            throw TransferFailure(TransferError::CHECKSUM_MISMATCH,
                                  "chunk checksum mismatch at offset " + std::to_string(received));
        }

        disk_op("writing " + part_path, [&] { writer.write_at(received, data, chunk->raw_len); });
        stream.update(data, chunk->raw_len);
        received += chunk->raw_len;
        report_progress(job, received, received == total);
    }

    disk_op("flushing " + part_path, [&] { writer.close(); });

    hash::Hash128 got = stream.digest();
    if (got != offer.stream_xxh3_128) {
        throw TransferFailure(TransferError::CHECKSUM_MISMATCH,
                              "stream checksum mismatch: expected " + hash::to_hex(offer.stream_xxh3_128) +
                              ", got " + hash::to_hex(got));
    }
}

std::vector<std::string> TransferEngine::deliver(Job& job, const TransferOfferFrame& offer,
                                                 const std::string& part_path,
                                                 std::vector<std::string>& temp_files) {
    const u64 id = offer.job_id;
    std::vector<std::string> sources;

    if (offer.bundled) {
        for (size_t i = 0; i < offer.entries.size(); ++i) {
            sources.push_back(temp_path("recv-", id, ("." + std::to_string(i) + ".part").c_str()));
        }
        temp_files.insert(temp_files.end(), sources.begin(), sources.end());

        int bad = disk_op("splitting bundle", [&] {
            return split_archive(part_path, offer.entries, sources);
        });
        if (bad >= 0) {
            throw TransferFailure(TransferError::CHECKSUM_MISMATCH,
                                  "checksum mismatch for " + offer.entries[(size_t)bad].name);
        }
    } else {
        if (offer.entries.front().xxh3_128 != offer.stream_xxh3_128) {
            throw TransferFailure(TransferError::CHECKSUM_MISMATCH, "file checksum mismatch");
        }
        sources.push_back(part_path);
    }

    if (job.cancel) throw JobCancelled{false};

    // Everything verified: move into place, undoing on failure
    std::vector<std::string> moved;
    try {
        fs::create_directories(cfg_.download_dir);
        for (size_t i = 0; i < sources.size(); ++i) {
            fs::path dest = file_io::claim_destination(cfg_.download_dir, offer.entries[i].name);
            moved.push_back(dest.string());
            fs::rename(sources[i], dest);
        }
    } catch (const std::exception& e) {
        for (auto& m : moved) file_io::remove_quietly(m);
        throw TransferFailure(TransferError::DISK_ERROR, std::string("saving files: ") + e.what());
    }

    for (auto& m : moved) LOG_INFO("Saved " + m);
    return moved;
}
