#include "utils/process.hpp"
#include "utils/logs.hpp"
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <pthread.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

namespace Process {
    
    static const std::chrono::seconds TERMINATE_GRACE(2);
    static const std::chrono::milliseconds EXIT_POLL_INTERVAL(50);
    
    std::string joinCommand(const std::vector<std::string>& argv) {
        std::string command;
        for (const auto& arg : argv) {
            if (!command.empty()) command += " ";
            if (arg.find(' ') != std::string::npos) {
                command += "\"" + arg + "\"";
            } else {
                command += arg;
            }
        }
        return command;
    }
    
    std::string summarize(const Outcome& outcome) {
        if (!outcome.launched) {
            return "not found";
        }
        
        if (outcome.timedOut) {
            return "timed out";
        }
        
        std::string lastLine;
        std::istringstream lines(outcome.output);
        std::string line;
        while (std::getline(lines, line)) {
            if (line.find_first_not_of(" \t\r") != std::string::npos) {
                lastLine = line;
            }
        }
        
        std::string summary = "exit " + std::to_string(outcome.exitCode);
        if (!lastLine.empty()) {
            summary += ": " + lastLine;
        }
        return summary;
    }
    
    static void closeFd(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
    
    static int waitForChild(pid_t pid) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return -1;
            }
        }
        
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }
    
    static bool childExited(pid_t pid, int& exitCode) {
        int status = 0;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result != pid) {
            return false;
        }
        exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        return true;
    }
    
    // The child leads its own process group; signal the whole group so helpers it spawned go too
    static void signalChild(pid_t pid, int sig) {
        if (kill(-pid, sig) != 0) {
            kill(pid, sig);
        }
    }
    
    static int pollTimeout(std::chrono::milliseconds remaining) {
        return static_cast<int>(std::min<std::chrono::milliseconds::rep>(remaining.count(), INT_MAX));
    }
    
    // A child that exits without reading stdin must not take us down with SIGPIPE.
    // The signal is blocked for this thread only and a pending one is consumed.
    static void feedInput(int fd, const std::string& input) {
        sigset_t pipeSet;
        sigset_t previous;
        sigemptyset(&pipeSet);
        sigaddset(&pipeSet, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &pipeSet, &previous);
        
        size_t offset = 0;
        while (offset < input.size()) {
            ssize_t written = write(fd, input.data() + offset, input.size() - offset);
            if (written < 0) {
                if (errno == EINTR) continue;
                Logs::debug(std::string("stdin write stopped: ") + strerror(errno));
                break;
            }
            offset += static_cast<size_t>(written);
        }
        
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1 && 
            sigismember(&previous, SIGPIPE) == 0) {
            int consumed = 0;
            sigwait(&pipeSet, &consumed);
        }
        
        pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    }
    
    Outcome SystemRunner::run(const std::vector<std::string>& argv,
                              std::chrono::seconds timeout,
                              const std::string& input) {
        Outcome outcome;
        if (argv.empty()) {
            return outcome;
        }
        
        Logs::debug("Executing: " + joinCommand(argv));
        
        int outPipe[2];
        int inPipe[2];
        int execPipe[2];
        
        if (pipe(outPipe) != 0) {
            outcome.output = std::string("pipe: ") + strerror(errno);
            return outcome;
        }
        if (pipe(inPipe) != 0) {
            close(outPipe[0]);
            close(outPipe[1]);
            outcome.output = std::string("pipe: ") + strerror(errno);
            return outcome;
        }
        if (pipe(execPipe) != 0) {
            close(outPipe[0]);
            close(outPipe[1]);
            close(inPipe[0]);
            close(inPipe[1]);
            outcome.output = std::string("pipe: ") + strerror(errno);
            return outcome;
        }
        fcntl(execPipe[1], F_SETFD, FD_CLOEXEC);
        
        std::vector<char*> args;
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);
        
        pid_t pid = fork();
        if (pid < 0) {
            outcome.output = std::string("fork: ") + strerror(errno);
            close(outPipe[0]);
            close(outPipe[1]);
            close(inPipe[0]);
            close(inPipe[1]);
            close(execPipe[0]);
            close(execPipe[1]);
            return outcome;
        }
        
        if (pid == 0) {
            // A terminal Ctrl-C goes to the foreground group only; a started tool always runs to completion
            setpgid(0, 0);
            signal(SIGINT, SIG_IGN);
            signal(SIGPIPE, SIG_DFL);
            
            dup2(inPipe[0], STDIN_FILENO);
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(outPipe[1], STDERR_FILENO);
            close(inPipe[0]);
            close(inPipe[1]);
            close(outPipe[0]);
            close(outPipe[1]);
            close(execPipe[0]);
            
            execvp(args[0], args.data());
            
            int err = errno;
            ssize_t ignored = write(execPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        
        // Also set from the child; whichever runs first wins
        setpgid(pid, pid);
        
        close(inPipe[0]);
        close(outPipe[1]);
        close(execPipe[1]);
        
        int execError = 0;
        ssize_t got;
        do {
            got = read(execPipe[0], &execError, sizeof(execError));
        } while (got < 0 && errno == EINTR);
        close(execPipe[0]);
        
        if (got == static_cast<ssize_t>(sizeof(execError))) {
            close(inPipe[1]);
            close(outPipe[0]);
            waitForChild(pid);
            outcome.output = std::string(argv[0]) + ": " + strerror(execError);
            return outcome;
        }
        
        outcome.launched = true;
        
        int writeFd = inPipe[1];
        if (!input.empty()) {
            feedInput(writeFd, input);
        }
        closeFd(writeFd);
        
        auto deadline = std::chrono::steady_clock::now() + timeout;
        int readFd = outPipe[0];
        char buffer[4096];
        
        while (readFd >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                outcome.timedOut = true;
                break;
            }
            
            struct pollfd pfd;
            pfd.fd = readFd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            
            int ready = poll(&pfd, 1, pollTimeout(remaining));
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (ready == 0) {
                continue;
            }
            
            ssize_t count = read(readFd, buffer, sizeof(buffer));
            if (count > 0) {
                outcome.output.append(buffer, static_cast<size_t>(count));
            } else if (count == 0 || errno != EINTR) {
                closeFd(readFd);
            }
        }
        closeFd(readFd);
        
        // Output closed; the child may still be running
        int exitCode = -1;
        bool exited = false;
        while (!outcome.timedOut) {
            if (childExited(pid, exitCode)) {
                exited = true;
                break;
            }
            
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                outcome.timedOut = true;
                break;
            }
            std::this_thread::sleep_for(std::min(remaining, EXIT_POLL_INTERVAL));
        }
        
        if (outcome.timedOut) {
            Logs::warning(joinCommand(argv) + " timed out after " + 
                          std::to_string(timeout.count()) + "s, terminating");
            signalChild(pid, SIGTERM);
            
            auto graceEnd = std::chrono::steady_clock::now() + TERMINATE_GRACE;
            while (!childExited(pid, exitCode)) {
                if (std::chrono::steady_clock::now() >= graceEnd) {
                    signalChild(pid, SIGKILL);
                    exitCode = waitForChild(pid);
                    break;
                }
                std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
            }
            outcome.exitCode = exitCode;
            return outcome;
        }
        
        outcome.exitCode = exited ? exitCode : waitForChild(pid);
        return outcome;
    }
    
    std::string SystemRunner::which(const std::string& tool) {
        if (tool.empty()) {
            return "";
        }
        
        if (tool.find('/') != std::string::npos) {
            return access(tool.c_str(), X_OK) == 0 ? tool : "";
        }
        
        const char* pathEnv = getenv("PATH");
        std::string path = pathEnv ? pathEnv : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
        
        std::istringstream dirs(path);
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) continue;
            
            std::string candidate = dir + "/" + tool;
            struct stat st;
            if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
                access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        
        return "";
    }
}
