#include "gitpass/SecretStore.hpp"
#include "gitpass/Errors.hpp"
#include "gitpass/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <iconv.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gitpass {

namespace {

// Owns one end of a pipe.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }

    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

// Read until EOF, retrying on EINTR.
std::string read_all(int fd) {
    std::string out;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw SecretStoreError(errno_message("Failed to read child output", errno));
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw SecretStoreError(errno_message("waitpid failed", errno));
        }
    }
    return status;
}

std::string normalize_encoding(const std::string& encoding) {
    std::string e = encoding;
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c){ return std::toupper(c); });
    std::replace(e.begin(), e.end(), '_', '-');
    if (e == "UTF8") return "UTF-8";
    if (e == "LATIN-1" || e == "L1") return "LATIN1";
    return e;
}

} // anonymous namespace

std::string run_capture(const std::vector<std::string>& argv, const Environment& env) {
    if (argv.empty()) {
        throw SecretStoreError("No program to run");
    }

    int out_fds[2];
    if (::pipe2(out_fds, O_CLOEXEC) != 0) {
        throw SecretStoreError(errno_message("pipe failed", errno));
    }
    FileDescriptor out_read(out_fds[0]);
    FileDescriptor out_write(out_fds[1]);

    // Closed on a successful exec; carries errno otherwise.
    int err_fds[2];
    if (::pipe2(err_fds, O_CLOEXEC) != 0) {
        throw SecretStoreError(errno_message("pipe failed", errno));
    }
    FileDescriptor err_read(err_fds[0]);
    FileDescriptor err_write(err_fds[1]);

    // Prepared before fork so the child only calls async-signal-safe functions.
    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    std::vector<std::string> env_strings;
    for (const auto& [name, value] : env) env_strings.push_back(name + "=" + value);
    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw SecretStoreError(errno_message("fork failed", errno));
    }

    if (pid == 0) {
        // Child process
        ::dup2(out_write.get(), STDOUT_FILENO);
        ::execvpe(args[0], args.data(), envp.data());
        int err = errno;
        ssize_t ignored = ::write(err_write.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    out_write.reset();
    err_write.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_read.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_child(pid);
        throw SecretStoreError(errno_message("Unable to run '" + argv[0] + "'", exec_errno));
    }

    std::string output;
    try {
        output = read_all(out_read.get());
    } catch (const SecretStoreError&) {
        wait_child(pid);
        throw;
    }

    int status = wait_child(pid);
    if (WIFSIGNALED(status)) {
        throw SecretStoreError("'" + argv[0] + "' was killed by signal " +
                               std::to_string(WTERMSIG(status)));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        throw SecretStoreError("'" + argv[0] + "' exited with status " +
                               std::to_string(WEXITSTATUS(status)));
    }
    return output;
}

std::string PassStore::show(const std::string& target, const Environment& env) {
    logger()->debug("Running {} show {}", program_, target);
    return run_capture({program_, "show", target}, env);
}

std::string decode_text(const std::string& bytes, const std::string& encoding) {
    const std::string from = normalize_encoding(encoding);

    iconv_t cd = ::iconv_open("UTF-8", from.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        throw ConfigValueError("Unknown encoding '" + encoding + "'");
    }

    std::string out;
    std::string in = bytes;
    char* in_ptr = in.data();
    size_t in_left = in.size();
    char buf[4096];

    while (in_left > 0) {
        char* out_ptr = buf;
        size_t out_left = sizeof(buf);
        size_t rc = ::iconv(cd, &in_ptr, &in_left, &out_ptr, &out_left);
        out.append(buf, sizeof(buf) - out_left);
        if (rc == static_cast<size_t>(-1) && errno != E2BIG) {
            int err = errno;
            ::iconv_close(cd);
            throw SecretStoreError("Unable to decode entry as " + encoding + ": " +
                                   std::strerror(err));
        }
    }
    ::iconv_close(cd);
    return out;
}

} // namespace gitpass
