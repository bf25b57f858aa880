/**
 * @file gpg_cipher.cpp
 * @brief gpg child process management
 */

#include "kcenon/cloud_backup/encryption/gpg_cipher.h"
#include "kcenon/cloud_backup/core/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kcenon::cloud_backup {

namespace {

/// Must fit the default pipe capacity so the pre-fork write cannot block
constexpr std::size_t max_passphrase_bytes = 65536;

/// Bytes of gpg diagnostics kept for error messages
constexpr std::size_t max_stderr_bytes = 4096;

class unique_fd {
public:
    unique_fd() = default;
    explicit unique_fd(int fd) : fd_(fd) {}
    ~unique_fd() { reset(); }

    unique_fd(const unique_fd&) = delete;
    auto operator=(const unique_fd&) -> unique_fd& = delete;
    unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
    auto operator=(unique_fd&& other) noexcept -> unique_fd& {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] explicit operator bool() const noexcept { return fd_ >= 0; }

    auto release() noexcept -> int {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    auto reset(int fd = -1) noexcept -> void {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

auto errno_message(const std::string& what) -> std::string {
    return what + ": " + std::strerror(errno);
}

auto write_all(int fd, const char* data, std::size_t size) -> bool {
    while (size > 0) {
        auto written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

auto drain(int fd, std::string& sink) -> void {
    char buffer[512];
    while (true) {
        auto n = ::read(fd, buffer, sizeof(buffer));
        if (n <= 0) {
            return;
        }
        if (sink.size() < max_stderr_bytes) {
            sink.append(buffer, static_cast<std::size_t>(n));
        }
    }
}

auto last_line(std::string text) -> std::string {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    auto pos = text.rfind('\n');
    return pos == std::string::npos ? text : text.substr(pos + 1);
}

}  // namespace

gpg_cipher::gpg_cipher(cipher_options options) : options_(std::move(options)) {}

auto gpg_cipher::algorithm() const -> std::string {
    std::string algo = options_.algorithm;
    std::transform(algo.begin(), algo.end(), algo.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "gpg-" + algo;
}

auto gpg_cipher::build_arguments(int passphrase_fd) const -> std::vector<std::string> {
    std::vector<std::string> args{
        options_.executable,
        "--batch",
        "--yes",
        "--quiet",
        "--no-tty",
        "--pinentry-mode", "loopback",
        "--passphrase-fd", std::to_string(passphrase_fd),
        "--symmetric",
        "--cipher-algo", options_.algorithm,
        "--compress-algo", "none",
        "--output", "-",
    };
    if (options_.homedir) {
        args.insert(args.begin() + 1, {"--homedir", options_.homedir->string()});
    }
    return args;
}

auto gpg_cipher::encrypt(const std::filesystem::path& input,
                         const std::filesystem::path& output,
                         const scoped_secret& passphrase,
                         const std::atomic<bool>& abort_flag) -> result<uint64_t> {
    if (passphrase.empty()) {
        return unexpected{error{error_code::missing_passphrase, "empty passphrase"}};
    }

    unique_fd in_fd(::open(input.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in_fd) {
        return unexpected{error{error_code::file_read_error,
                                errno_message("cannot open " + input.string())}};
    }
    // Compression is off, so a complete OpenPGP message always outgrows its plaintext
    struct stat input_stat {};
    if (::fstat(in_fd.get(), &input_stat) != 0) {
        return unexpected{error{error_code::file_read_error,
                                errno_message("cannot stat " + input.string())}};
    }
    const auto plain_size = static_cast<uint64_t>(input_stat.st_size);

    unique_fd out_fd(::open(output.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
    if (!out_fd) {
        return unexpected{error{error_code::file_write_error,
                                errno_message("cannot create " + output.string())}};
    }

    // The passphrase is written before fork; the pipe buffer holds it until gpg reads
    int pass_pipe[2];
    if (::pipe2(pass_pipe, O_CLOEXEC) != 0) {
        return unexpected{error{error_code::internal_error, errno_message("pipe2")}};
    }
    unique_fd pass_read(pass_pipe[0]);
    unique_fd pass_write(pass_pipe[1]);

    auto secret = passphrase.view();
    if (secret.size() + 1 > max_passphrase_bytes) {
        return unexpected{error{error_code::invalid_configuration, "passphrase too long"}};
    }
    if (!write_all(pass_write.get(), secret.data(), secret.size()) ||
        !write_all(pass_write.get(), "\n", 1)) {
        return unexpected{error{error_code::internal_error,
                                errno_message("writing passphrase pipe")}};
    }
    pass_write.reset();

    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC | O_NONBLOCK) != 0) {
        return unexpected{error{error_code::internal_error, errno_message("pipe2")}};
    }
    unique_fd err_read(err_pipe[0]);
    unique_fd err_write(err_pipe[1]);

    // Everything the child touches is prepared before fork
    auto arguments = build_arguments(pass_read.get());
    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (auto& arg : arguments) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return unexpected{error{error_code::internal_error, errno_message("fork")}};
    }
    if (pid == 0) {
        ::dup2(in_fd.get(), STDIN_FILENO);
        ::dup2(out_fd.get(), STDOUT_FILENO);
        ::dup2(err_write.get(), STDERR_FILENO);
        int flags = ::fcntl(pass_read.get(), F_GETFD);
        ::fcntl(pass_read.get(), F_SETFD, flags & ~FD_CLOEXEC);
        // stderr is non-blocking on the read side only
        int err_flags = ::fcntl(STDERR_FILENO, F_GETFL);
        ::fcntl(STDERR_FILENO, F_SETFL, err_flags & ~O_NONBLOCK);
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    pass_read.reset();
    err_write.reset();
    in_fd.reset();
    out_fd.reset();

    std::string diagnostics;
    int status = 0;
    bool aborted = false;
    while (true) {
        drain(err_read.get(), diagnostics);

        auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            auto message = errno_message("waitpid");
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            std::error_code ec;
            std::filesystem::remove(output, ec);
            return unexpected{error{error_code::internal_error, message}};
        }
        if (!aborted && abort_flag.load()) {
            ::kill(pid, SIGTERM);
            aborted = true;
        }
        std::this_thread::sleep_for(poll_interval_);
    }
    drain(err_read.get(), diagnostics);

    std::error_code ec;
    if (aborted) {
        std::filesystem::remove(output, ec);
        return unexpected{error{error_code::job_aborted,
                                "encryption of " + input.filename().string() + " interrupted"}};
    }

    if (WIFSIGNALED(status)) {
        std::filesystem::remove(output, ec);
        return unexpected{error{error_code::cipher_terminated,
                                "gpg killed by signal " + std::to_string(WTERMSIG(status))}};
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code == 127) {
        std::filesystem::remove(output, ec);
        return unexpected{error{error_code::cipher_unavailable,
                                "cannot execute " + options_.executable}};
    }
    if (exit_code != 0) {
        std::filesystem::remove(output, ec);
        auto detail = last_line(diagnostics);
        return unexpected{error{error_code::cipher_failed,
                                "gpg exited with status " + std::to_string(exit_code) +
                                (detail.empty() ? "" : ": " + detail)}};
    }

    auto size = std::filesystem::file_size(output, ec);
    if (ec) {
        size = 0;
    }
    if (size <= plain_size) {
        std::filesystem::remove(output, ec);
        return unexpected{error{error_code::cipher_output_truncated,
                                "gpg produced " + std::to_string(size) + " bytes for " +
                                std::to_string(plain_size) + " bytes of " +
                                input.filename().string()}};
    }

    CB_LOG_TRACE(log_category::cipher,
                 "Encrypted " + input.filename().string() + " to " +
                 std::to_string(size) + " bytes");
    return size;
}

}  // namespace kcenon::cloud_backup
