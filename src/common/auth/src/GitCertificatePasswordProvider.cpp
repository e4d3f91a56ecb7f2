// src/common/auth/src/GitCertificatePasswordProvider.cpp
#include "common/auth/include/GitCertificatePasswordProvider.hpp"
#include "common/utils/logger/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <pthread.h>
#include <spawn.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace objfetch::auth
{
    namespace
    {
        // fd 소유 래퍼
        class ScopedFd
        {
        private:
            int fd_ = -1;

        public:
            ScopedFd() = default;
            ~ScopedFd() { Reset(); }

            ScopedFd(const ScopedFd&) = delete;
            ScopedFd& operator=(const ScopedFd&) = delete;

            int Get() const { return fd_; }

            void Reset(int fd = -1)
            {
                if (fd_ >= 0) {
                    close(fd_);
                }
                fd_ = fd;
            }
        };

        bool CreatePipe(ScopedFd& read_end, ScopedFd& write_end)
        {
            int fds[2];
            if (pipe2(fds, O_CLOEXEC) != 0) {
                return false;
            }
            read_end.Reset(fds[0]);
            write_end.Reset(fds[1]);
            return true;
        }

        /**
         * @brief 자식이 먼저 종료해도 SIGPIPE 로 죽지 않도록 이 스레드에서만 막는다
         */
        class ScopedSigpipeBlock
        {
        private:
            sigset_t sigpipe_set_;
            sigset_t old_set_;

        public:
            ScopedSigpipeBlock()
            {
                sigemptyset(&sigpipe_set_);
                sigaddset(&sigpipe_set_, SIGPIPE);
                pthread_sigmask(SIG_BLOCK, &sigpipe_set_, &old_set_);
            }

            ~ScopedSigpipeBlock()
            {
                // 우리가 만든 SIGPIPE 는 버린다
                struct timespec zero = {0, 0};
                while (sigtimedwait(&sigpipe_set_, nullptr, &zero) > 0) {
                }
                pthread_sigmask(SIG_SETMASK, &old_set_, nullptr);
            }
        };

        bool WriteAll(int fd, const std::string& data)
        {
            size_t written = 0;
            while (written < data.size()) {
                ssize_t n = write(fd, data.data() + written, data.size() - written);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return false;
                }
                written += static_cast<size_t>(n);
            }
            return true;
        }

        bool ReadAll(int fd, std::string& output)
        {
            char buffer[512];
            while (true) {
                ssize_t n = read(fd, buffer, sizeof(buffer));
                if (n == 0) {
                    return true;
                }
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return false;
                }
                output.append(buffer, static_cast<size_t>(n));
            }
        }
    }

    GitCertificatePasswordProvider::GitCertificatePasswordProvider(std::string git_binary)
        : git_binary_(std::move(git_binary))
    {
        if (git_binary_.empty()) {
            git_binary_ = "git";
        }
    }

    bool GitCertificatePasswordProvider::TryGetCertificatePassword(
        tracing::ITracer& tracer,
        const std::string& cert_id,
        std::string& password,
        std::string& error_message)
    {
        std::string output;
        if (!RunCredentialFill(BuildCredentialRequest(cert_id), output, error_message)) {
            tracing::EventMetadata metadata;
            metadata["CertId"] = cert_id;
            metadata["ErrorMessage"] = error_message;
            tracer.RelatedEvent(tracing::EventLevel::WARNING, "CertificatePasswordUnavailable", metadata);
            return false;
        }

        std::optional<std::string> parsed = ParsePassword(output);
        if (!parsed) {
            error_message = "Credential helper returned no password for certificate " + cert_id;
            tracing::EventMetadata metadata;
            metadata["CertId"] = cert_id;
            metadata["ErrorMessage"] = error_message;
            tracer.RelatedEvent(tracing::EventLevel::WARNING, "CertificatePasswordUnavailable", metadata);
            return false;
        }

        password = *parsed;
        return true;
    }

    std::string GitCertificatePasswordProvider::BuildCredentialRequest(const std::string& cert_id)
    {
        std::ostringstream oss;
        oss << "protocol=cert\n";
        oss << "path=" << cert_id << "\n";
        oss << "username=\n";
        oss << "\n";
        return oss.str();
    }

    std::optional<std::string> GitCertificatePasswordProvider::ParsePassword(const std::string& output)
    {
        std::istringstream iss(output);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            const std::string prefix = "password=";
            if (line.compare(0, prefix.size(), prefix) == 0) {
                return line.substr(prefix.size());
            }
        }
        return std::nullopt;
    }

    bool GitCertificatePasswordProvider::RunCredentialFill(
        const std::string& input,
        std::string& output,
        std::string& error_message) const
    {
        ScopedFd stdin_read, stdin_write, stdout_read, stdout_write;
        if (!CreatePipe(stdin_read, stdin_write) || !CreatePipe(stdout_read, stdout_write)) {
            error_message = std::string("Failed to create pipe: ") + std::strerror(errno);
            return false;
        }

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_adddup2(&actions, stdin_read.Get(), STDIN_FILENO);
        posix_spawn_file_actions_adddup2(&actions, stdout_write.Get(), STDOUT_FILENO);

        std::string credential = "credential";
        std::string fill = "fill";
        char* argv[] = {
            const_cast<char*>(git_binary_.c_str()),
            credential.data(),
            fill.data(),
            nullptr
        };

        pid_t pid = 0;
        int spawn_result = posix_spawnp(&pid, git_binary_.c_str(), &actions, nullptr, argv, environ);
        posix_spawn_file_actions_destroy(&actions);

        if (spawn_result != 0) {
            error_message = "Failed to start " + git_binary_ + ": " + std::strerror(spawn_result);
            return false;
        }

        LOG_DEBUGF("GitCredential", "Started %s credential fill (pid %d)", git_binary_.c_str(), static_cast<int>(pid));

        // 부모 쪽에서 쓰지 않는 끝은 닫아야 EOF 가 전달된다
        stdin_read.Reset();
        stdout_write.Reset();

        bool write_ok = false;
        {
            ScopedSigpipeBlock sigpipe_block;
            write_ok = WriteAll(stdin_write.Get(), input);
        }
        stdin_write.Reset();

        bool read_ok = ReadAll(stdout_read.Get(), output);
        stdout_read.Reset();

        int status = 0;
        pid_t waited = 0;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (waited < 0) {
            error_message = std::string("Failed to wait for git: ") + std::strerror(errno);
            return false;
        }

        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            error_message = git_binary_ + " credential fill exited with code " + std::to_string(code);
            return false;
        }

        if (!write_ok || !read_ok) {
            error_message = "Failed to communicate with " + git_binary_ + " credential fill";
            return false;
        }

        return true;
    }
}
