#include "recon_service.hpp"
#include <core/log.hpp>
#include <ssh/ssh_transport.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

static std::unique_ptr<Transport> default_transport(const Config& config,
                                                    std::unique_ptr<Transport> transport) {
    if (transport) return transport;
    return std::make_unique<SshTransport>(config.ssh());
}

ReconService::ReconService(const Config& config, std::unique_ptr<Transport> transport,
                           ProcessSpawner::Launcher launcher)
    : config_(config),
      cache_(config.cache_dir()),
      transport_(default_transport(config, std::move(transport))),
      session_(*transport_, cache_, config.ssh()),
      consoles_(session_, config.ssh().command_timeout),
      networks_(session_, config.ssh().command_timeout),
      scanner_(session_, config.scan()),
      tunnel_(session_, config.tunnel()),
      spawner_(session_, config.terminal(), std::move(launcher)) {
    // Leaving Connected closes everything that rides on the session
    session_.add_teardown_hook([this] { scanner_.stop(); });
    session_.add_teardown_hook([this] { tunnel_.close(); });
    session_.add_teardown_hook([this] { spawner_.close_all(); });
}

ReconService::~ReconService() {
    session_.disconnect();
}

// ── Connection lifecycle ──────────────────────────────────────

Result<void> ReconService::connect(const HostIdentity& identity, const Credentials& credentials,
                                   StatusCallback cb) {
    return session_.connect(identity, credentials, cb);
}

void ReconService::disconnect() {
    session_.disconnect();
}

// ── Operations ────────────────────────────────────────────────

Result<CommandResult> ReconService::exec(const std::string& command) {
    if (!session_.is_connected()) {
        return Result<CommandResult>::Err(ErrorKind::Channel, "Not connected");
    }
    auto result = transport_->execute(command, config_.ssh().command_timeout);
    if (result.is_ok()) recon_log_cmd("exec", command, result.value);
    return result;
}

Result<ScanTaskPtr> ReconService::scan_interface(const std::string& iface, MergeMode mode,
                                                 NodeScanner::NodeCallback on_node) {
    auto ni = networks_.find(iface);
    if (ni.is_err()) return Result<ScanTaskPtr>::Err(ni);
    return scanner_.scan(ni.value, mode, std::move(on_node));
}

Result<void> ReconService::open_browser(const std::string& url) {
    const auto& argv = config_.tunnel().browser;
    if (argv.empty()) {
        return Result<void>::Err(ErrorKind::Config, "No browser configured (tunnel.browser)");
    }

    std::vector<std::string> args;
    bool substituted = false;
    for (size_t i = 1; i < argv.size(); i++) {
        std::string a = argv[i];
        auto pos = a.find("{url}");
        if (pos != std::string::npos) {
            a.replace(pos, 5, url);
            substituted = true;
        }
        args.push_back(a);
    }
    // "firefox" alone still gets the URL
    if (!substituted) args.push_back(url);

    std::lock_guard<std::mutex> lock(browsers_mutex_);
    browsers_.erase(std::remove_if(browsers_.begin(), browsers_.end(),
                                   [](platform::ProcessHandle& p) { return !p.running(); }),
                    browsers_.end());

    auto proc = platform::spawn(argv[0], args, recon_log_path());
    if (!proc.valid()) {
        return Result<void>::Err(ErrorKind::Io,
            fmt::format("Cannot launch browser '{}': {}", argv[0], std::strerror(errno)));
    }
    recon_log(fmt::format("browser: {} {}", argv[0], url));
    browsers_.push_back(std::move(proc));
    return Result<void>::Ok();
}
