#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <ssh/transport.hpp>

// In-memory Transport for engine tests.
//
// Exec channels answer through `responder`, evaluated on the first read so
// slow responders run outside the negotiation lock, like a real remote command.
// Every other channel kind echoes what is written to it.

class FakeChannel : public Channel {
public:
    FakeChannel(int id, const ChannelSpec& spec, std::shared_ptr<std::atomic<bool>> alive,
                std::function<CommandResult(const std::string&)> responder)
        : Channel(id, spec.kind), spec_(spec), alive_(std::move(alive)),
          responder_(std::move(responder)) {}

    const ChannelSpec& spec() const { return spec_; }

    bool is_open() const override { return !closed_.load(); }

    Result<size_t> read(char* buf, size_t len) override {
        if (closed_ || !*alive_) return Result<size_t>::Err(ErrorKind::Channel, "Channel closed");
        answer();
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = std::min(len, out_.size());
        out_.copy(buf, n);
        out_.erase(0, n);
        return Result<size_t>::Ok(n);
    }

    Result<size_t> read_stderr(char* buf, size_t len) override {
        if (closed_ || !*alive_) return Result<size_t>::Err(ErrorKind::Channel, "Channel closed");
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = std::min(len, err_.size());
        err_.copy(buf, n);
        err_.erase(0, n);
        return Result<size_t>::Ok(n);
    }

    Result<void> write(const char* data, size_t len) override {
        if (closed_ || !*alive_) return Result<void>::Err(ErrorKind::Channel, "Channel closed");
        std::lock_guard<std::mutex> lock(mutex_);
        written_.append(data, len);
        if (kind() != ChannelKind::Exec) out_.append(data, len);
        return Result<void>::Ok();
    }
    using Channel::write;

    Result<void> send_eof() override { return Result<void>::Ok(); }

    bool eof() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (kind() == ChannelKind::Exec) return answered_ && out_.empty() && err_.empty();
        return remote_eof_ && out_.empty();
    }

    Result<void> resize(int cols, int rows) override {
        if (closed_) return Result<void>::Err(ErrorKind::Channel, "Channel closed");
        cols_ = cols;
        rows_ = rows;
        return Result<void>::Ok();
    }

    int exit_status() override { return exit_code_; }

    void close() override { closed_ = true; }

    // Remote program output / exit, for interactive channels
    void push_output(const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ += data;
    }
    void finish_remote() {
        std::lock_guard<std::mutex> lock(mutex_);
        remote_eof_ = true;
    }

    std::string written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    std::atomic<int> cols_{0};
    std::atomic<int> rows_{0};

private:
    ChannelSpec spec_;
    std::shared_ptr<std::atomic<bool>> alive_;
    std::function<CommandResult(const std::string&)> responder_;

    mutable std::mutex mutex_;
    std::string out_;
    std::string err_;
    std::string written_;
    bool answered_ = false;
    bool remote_eof_ = false;
    std::atomic<bool> closed_{false};
    int exit_code_ = -1;

    void answer() {
        if (kind() != ChannelKind::Exec) return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (answered_) return;
        }
        CommandResult r;
        r.exit_code = 0;
        if (responder_) r = responder_(spec_.command);
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = r.stdout_data;
        err_ = r.stderr_data;
        exit_code_ = r.exit_code;
        answered_ = true;
    }
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(int max_channels = SSH_MAX_CHANNELS) : Transport(max_channels) {}

    ~FakeTransport() override { disconnect(); }

    static CommandResult reply(int exit_code, const std::string& out = "",
                               const std::string& err = "") {
        CommandResult r;
        r.exit_code = exit_code;
        r.stdout_data = out;
        r.stderr_data = err;
        return r;
    }

    // ── Knobs ─────────────────────────────────────────────────

    std::function<CommandResult(const std::string&)> responder;
    Result<void> connect_result = Result<void>::Ok();
    std::set<std::string> unreachable;          // Forward targets that refuse

    // Simulate the connection dropping underneath the session.
    void drop() {
        *alive_ = false;
        connected_ = false;
    }

    // ── Observations ─────────────────────────────────────────

    std::atomic<int> connects{0};
    std::atomic<int> disconnects{0};
    HostIdentity last_identity;

    std::vector<std::shared_ptr<FakeChannel>> channels() const {
        std::lock_guard<std::mutex> lock(opened_mutex_);
        return opened_;
    }

    std::shared_ptr<FakeChannel> last_channel(ChannelKind kind) const {
        std::lock_guard<std::mutex> lock(opened_mutex_);
        for (auto it = opened_.rbegin(); it != opened_.rend(); ++it) {
            if ((*it)->kind() == kind) return *it;
        }
        return nullptr;
    }

    bool is_connected() const override { return connected_.load(); }
    bool check_alive() override { return connected_.load() && *alive_; }

protected:
    Result<void> do_connect(const ConnectRequest& request) override {
        connects++;
        last_identity = request.identity;
        if (request.on_status) request.on_status("Connecting to " + request.identity.host);
        if (request.on_authenticating) request.on_authenticating();
        if (connect_result.is_err()) return connect_result;
        alive_ = std::make_shared<std::atomic<bool>>(true);
        connected_ = true;
        return Result<void>::Ok();
    }

    void do_disconnect() override {
        if (connected_) disconnects++;
        *alive_ = false;
        connected_ = false;
    }

    Result<ChannelPtr> do_open_channel(const ChannelSpec& spec, int id) override {
        if (spec.kind == ChannelKind::Forward &&
            unreachable.count(spec.host + ":" + std::to_string(spec.port))) {
            return Result<ChannelPtr>::Err(ErrorKind::Channel, "Connection refused");
        }
        auto ch = std::make_shared<FakeChannel>(id, spec, alive_, responder);
        {
            std::lock_guard<std::mutex> lock(opened_mutex_);
            opened_.push_back(ch);
        }
        return Result<ChannelPtr>::Ok(ch);
    }

private:
    std::atomic<bool> connected_{false};
    std::shared_ptr<std::atomic<bool>> alive_ = std::make_shared<std::atomic<bool>>(false);

    mutable std::mutex opened_mutex_;
    std::vector<std::shared_ptr<FakeChannel>> opened_;
};

// Wait until pred() holds or the timeout passes.
inline bool eventually(const std::function<bool()>& pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Fresh directory under the system temp dir, removed by the destructor.
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path() /
               ("recon_test_" + tag + "_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter++));
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};
