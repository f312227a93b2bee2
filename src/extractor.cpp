#include "katafetch/extractor.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace katafetch {

namespace {

struct ChildStatus {
    bool launched = false;
    int exit_code = -1;
    std::string stderr_text;
    std::string launch_error;
};

// fork/exec argv[0] via PATH, capturing the child's stderr.
ChildStatus run_child(const std::vector<std::string>& args) {
    ChildStatus status;

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        status.launch_error = std::string("pipe failed: ") + std::strerror(errno);
        return status;
    }

    pid_t pid = fork();
    if (pid < 0) {
        status.launch_error = std::string("fork failed: ") + std::strerror(errno);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return status;
    }

    if (pid == 0) {
        // Child: stderr to the pipe, stdout to /dev/null
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) dup2(devnull, STDOUT_FILENO);

        execvp(argv[0], argv.data());

        fprintf(stderr, "Unable to launch %s (execvp error %d: %s)\n",
                argv[0], errno, strerror(errno));
        _exit(127);
    }

    close(err_pipe[1]);
    char buf[4096];
    while (true) {
        ssize_t n = read(err_pipe[0], buf, sizeof(buf));
        if (n > 0) {
            // Keep the head of the output; tar can be very chatty on bad input
            if (status.stderr_text.size() < 16 * 1024) status.stderr_text.append(buf, n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(err_pipe[0]);

    int wstatus = 0;
    while (waitpid(pid, &wstatus, 0) < 0) {
        if (errno != EINTR) {
            status.launch_error = std::string("waitpid failed: ") + std::strerror(errno);
            return status;
        }
    }

    status.launched = true;
    if (WIFEXITED(wstatus)) {
        status.exit_code = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
        status.exit_code = 128 + WTERMSIG(wstatus);
    }
    return status;
}

size_t count_regular_files(const std::filesystem::path& dir) {
    size_t count = 0;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) ++count;
    }
    return count;
}

}  // namespace

Extractor::Extractor(ExtractorConfig config) : config_(std::move(config)) {}

ExtractResult Extractor::extract(const std::filesystem::path& archive,
                                 const std::string& date_id) const {
    ExtractResult result;
    result.output_dir = config_.extract_root / date_id;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(archive, ec)) {
        result.error_message = "archive not found: " + archive.string();
        return result;
    }

    std::filesystem::create_directories(result.output_dir, ec);
    if (ec) {
        result.error_message = "cannot create " + result.output_dir.string() + ": " + ec.message();
        return result;
    }

    // tar detects bzip2/gzip/xz input by itself when reading from a file
    std::vector<std::string> args = {
        config_.tar_program, "-xf", archive.string(),
        "-C", result.output_dir.string(),
        "--skip-old-files",
    };
    if (!config_.member_pattern.empty()) {
        args.push_back("--wildcards");
        args.push_back(config_.member_pattern);
    }

    auto child = run_child(args);
    if (!child.launched) {
        result.error_message = child.launch_error;
        return result;
    }

    result.exit_code = child.exit_code;
    result.files_present = count_regular_files(result.output_dir);
    if (child.exit_code != 0) {
        while (!child.stderr_text.empty() &&
               (child.stderr_text.back() == '\n' || child.stderr_text.back() == '\r')) {
            child.stderr_text.pop_back();
        }
        result.error_message = config_.tar_program + " exited with code " +
                               std::to_string(child.exit_code) +
                               (child.stderr_text.empty() ? "" : ": " + child.stderr_text);
        return result;
    }

    result.success = true;
    return result;
}

}  // namespace katafetch
