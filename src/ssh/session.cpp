#include "session.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>
#include <filesystem>
#include <mutex>

constexpr int SSH_AUTH_TIMEOUT_SECS = 20;   // handshake + authentication

static std::once_flag g_libssh2_init;

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round = 0;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static bool past(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::steady_clock::now() >= deadline;
}

SshSession::SshSession(HostKeyPolicy policy, std::shared_ptr<std::atomic<bool>> alive)
    : policy_(std::move(policy)),
      io_mutex_(std::make_shared<std::mutex>()),
      alive_(std::move(alive)) {
    alive_->store(false);
}

SshSession::~SshSession() {
    close();
}

// ── Establish ──────────────────────────────────────────────────

Result<void> SshSession::establish(const ConnectRequest& request) {
    auto say = [&](const std::string& msg) {
        recon_log("ssh: " + msg);
        if (request.on_status) request.on_status(msg);
    };

    int rc = 0;
    std::call_once(g_libssh2_init, [&] { rc = libssh2_init(0); });
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Network, "Failed to initialize libssh2");
    }

    say(fmt::format("Connecting to {}:{}...", request.identity.host, request.port));
    auto tcp = open_socket(request, request.timeout_secs * 1000);
    if (tcp.is_err()) return tcp;

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("init failed");
        return Result<void>::Err(ErrorKind::Network, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(SSH_AUTH_TIMEOUT_SECS);

    // SSH handshake (key exchange)
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (past(deadline)) {
            teardown("Handshake timed out");
            return Result<void>::Err(ErrorKind::Timeout,
                "SSH handshake timed out: " + request.identity.host);
        }
        platform::poll_socket(sock_, POLLIN, 100);
    }
    if (rc != 0) {
        teardown("Handshake failed");
        return Result<void>::Err(ErrorKind::Network,
            fmt::format("SSH handshake failed ({})", rc));
    }

    auto hostkey = verify_host_key(request);
    if (hostkey.is_err()) {
        teardown("Host key rejected");
        return hostkey;
    }

    // Enable TCP keepalive on the socket
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif

    // SSH keepalive every 30s; check_alive() sends one on demand
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    if (request.on_authenticating) request.on_authenticating();
    say("Authenticating as " + request.identity.user + "...");

    auto auth = userauth(request, deadline);
    if (auth.is_err()) {
        teardown("Authentication failed");
        return auth;
    }

    alive_->store(true);
    say("Connected to " + request.identity.key());
    return Result<void>::Ok();
}

Result<void> SshSession::open_socket(const ConnectRequest& request, int timeout_ms) {
    struct addrinfo hints, *found = nullptr;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    int gai = getaddrinfo(request.identity.host.c_str(),
                          std::to_string(request.port).c_str(), &hints, &found);
    if (gai != 0 || !found) {
        return Result<void>::Err(ErrorKind::Network,
            fmt::format("Failed to resolve host {}: {}", request.identity.host, gai_strerror(gai)));
    }

    std::string last_error = "no usable address";
    bool timed_out = false;
    for (auto* ai = found; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        // Non-blocking for libssh2 and for the connect timeout
        platform::set_nonblocking(fd);

        int ret = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            platform::close_socket(fd);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = platform::poll_socket(fd, POLLOUT, timeout_ms);
            if (revents == 0) {
                timed_out = true;
                last_error = "timed out";
                platform::close_socket(fd);
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                last_error = std::strerror(sock_err);
                platform::close_socket(fd);
                continue;
            }
        }

        sock_ = fd;
        break;
    }
    freeaddrinfo(found);

    if (sock_ < 0) {
        if (timed_out) {
            return Result<void>::Err(ErrorKind::Timeout,
                fmt::format("Connection to {} timed out after {}s",
                            request.identity.host, timeout_ms / 1000));
        }
        return Result<void>::Err(ErrorKind::Network,
            fmt::format("Failed to connect to {}: {}", request.identity.host, last_error));
    }
    return Result<void>::Ok();
}

// ── Host key ───────────────────────────────────────────────────

static int knownhost_key_type(int hostkey_type) {
    switch (hostkey_type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:       return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:       return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        case LIBSSH2_HOSTKEY_TYPE_ED25519:   return LIBSSH2_KNOWNHOST_KEY_ED25519;
        default:                             return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

Result<void> SshSession::verify_host_key(const ConnectRequest& request) {
    std::string path = policy_.known_hosts_path;
    if (path.empty()) path = (platform::home_dir() / ".ssh" / "known_hosts").string();

    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return Result<void>::Err(ErrorKind::Auth, "Server sent no host key");
    }

    LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session_);
    if (!hosts) {
        return Result<void>::Err(ErrorKind::Auth, "Cannot initialize known hosts");
    }

    // A missing file just means nothing is known yet
    libssh2_knownhost_readfile(hosts, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH);

    const std::string& host = request.identity.host;
    int type_mask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW;
    struct libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(hosts, host.c_str(), request.port,
                                         key, key_len, type_mask, &entry);

    Result<void> result = Result<void>::Ok();
    switch (check) {
        case LIBSSH2_KNOWNHOST_CHECK_MATCH:
            break;

        case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
            result = Result<void>::Err(ErrorKind::Auth,
                fmt::format("Host key for {} does not match {}", host, path));
            break;

        case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND: {
            if (policy_.strict) {
                result = Result<void>::Err(ErrorKind::Auth,
                    fmt::format("Host {} is not in {}", host, path));
                break;
            }
            std::string name = request.port == SSH_DEFAULT_PORT
                ? host : fmt::format("[{}]:{}", host, request.port);
            int rc = libssh2_knownhost_addc(hosts, name.c_str(), nullptr, key, key_len,
                                            nullptr, 0,
                                            type_mask | knownhost_key_type(key_type), nullptr);
            if (rc == 0) {
                std::error_code ec;
                std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
                if (libssh2_knownhost_writefile(hosts, path.c_str(),
                                                LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
                    recon_log("ssh: could not write " + path);
                }
            }
            recon_log(fmt::format("ssh: recorded new host key for {}", name));
            break;
        }

        default:
            result = Result<void>::Err(ErrorKind::Auth,
                fmt::format("Could not verify host key for {}", host));
            break;
    }

    libssh2_knownhost_free(hosts);
    return result;
}

// ── Authentication ─────────────────────────────────────────────

Result<void> SshSession::userauth(const ConnectRequest& request,
                                  std::chrono::steady_clock::time_point deadline) {
    const std::string& user = request.identity.user;
    const std::string& password = request.credentials.password;
    int ret;

    auto timed_out = [&] {
        return Result<void>::Err(ErrorKind::Timeout, "Authentication timed out");
    };

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (past(deadline)) return timed_out();
        platform::poll_socket(sock_, POLLIN, 100);
    }

    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        return Result<void>::Ok();
    }

    std::string methods = auth_list ? auth_list : "";
    recon_log("ssh: auth methods: " + methods);

    // Password auth
    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((ret = libssh2_userauth_password(session_, user.c_str(),
                                                password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (past(deadline)) return timed_out();
            platform::poll_socket(sock_, POLLIN, 100);
        }
        if (ret == 0) return Result<void>::Ok();
        if (ret != LIBSSH2_ERROR_AUTHENTICATION_FAILED &&
            ret != LIBSSH2_ERROR_PASSWORD_EXPIRED) {
            return Result<void>::Err(ErrorKind::Network,
                fmt::format("Connection failed during authentication ({})", ret));
        }
    }

    // Keyboard-interactive, answered with the same password
    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data;
        kbd_data.password = password;
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                             kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (past(deadline)) {
                *libssh2_session_abstract(session_) = nullptr;
                return timed_out();
            }
            platform::poll_socket(sock_, POLLIN, 100);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(ErrorKind::Auth,
        fmt::format("Authentication failed for {} (check username/password)",
                    request.identity.key()));
}

// ── Teardown ───────────────────────────────────────────────────

void SshSession::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

void SshSession::close() {
    // Mark inactive first so concurrent operations bail out early
    alive_->store(false);

    // Each libssh2 call gets its own brief lock
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
            session_ = nullptr;
        }
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

bool SshSession::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!alive_->load() || !session_ || sock_ < 0) return false;

    // Send SSH keepalive and check if connection is still up
    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        alive_->store(false);
        return false;
    }

    // Also check if the socket is still valid
    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        alive_->store(false);
        return false;
    }

    return true;
}
