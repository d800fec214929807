#include "platform/linux/ffmpeg_transcoder.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

FfmpegTranscoder::FfmpegTranscoder(std::string program)
    : program_(std::move(program)) {}

std::vector<std::string> FfmpegTranscoder::build_args(const std::string& input,
                                                      const std::string& output) {
    return {
        "-i", input,
        "-vn",
        "-acodec", "pcm_s16le",
        "-ar", "16000",
        "-ac", "1",
        "-write_bext", "0",
        "-fflags", "+bitexact",
        "-map_metadata", "-1",
        output,
        "-y",
    };
}

bool FfmpegTranscoder::is_relevant_line(const std::string& line) {
    return line.find("Duration:") != std::string::npos ||
           line.find("Stream") != std::string::npos ||
           line.find("error") != std::string::npos ||
           line.find("Error") != std::string::npos;
}

Result<void> FfmpegTranscoder::convert(const std::string& input, const std::string& output) {
    auto exe = platform::find_executable(program_);
    if (exe.empty()) {
        return make_error(ErrorCode::ConversionError,
                          std::format("{} is required to convert audio files to WAV\n"
                                      "Please install ffmpeg", program_));
    }

    auto args = build_args(input, output);
    std::vector<char*> argv;
    argv.push_back(exe.data());
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return make_error(ErrorCode::ConversionError,
                          std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return make_error(ErrorCode::ConversionError,
                          std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // ffmpeg reports progress on stderr; stdout is unused.
        ::dup2(pipefd[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
        }
        ::execv(exe.c_str(), argv.data());
        ::_exit(127);
    }

    ::close(pipefd[1]);

    if (FILE* diag = ::fdopen(pipefd[0], "r")) {
        char* line = nullptr;
        size_t cap = 0;
        ssize_t n;
        while ((n = ::getline(&line, &cap, diag)) > 0) {
            std::string s(line, static_cast<size_t>(n));
            if (is_relevant_line(s)) {
                std::fputs(s.c_str(), stderr);
            }
        }
        std::free(line);
        std::fclose(diag);
    } else {
        ::close(pipefd[0]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return make_error(ErrorCode::ConversionError,
                          std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFSIGNALED(status)) {
        return make_error(ErrorCode::ConversionError,
                          std::format("{} was killed by signal {}", program_, WTERMSIG(status)));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return make_error(ErrorCode::ConversionError,
                          std::format("Failed to convert audio file to WAV ({} exited with code {})",
                                      program_, WEXITSTATUS(status)));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(output, ec)) {
        return make_error(ErrorCode::ConversionError,
                          "Failed to convert audio file to WAV (no output produced)");
    }
    return {};
}
