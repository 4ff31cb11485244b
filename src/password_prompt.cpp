#include "password_prompt.hpp"
#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <termios.h>
#include <unistd.h>
#include <utility>

std::optional<Secret> readHiddenLine(const std::string& prompt) {
    static std::mutex lock;
    std::lock_guard<std::mutex> scope(lock);

    std::FILE* in = std::fopen("/dev/tty", "r+");
    std::FILE* out = in;
    if (in == nullptr) {
        in = stdin;
        out = stderr;
    }

    struct termios oflags;
    bool terminal = tcgetattr(fileno(in), &oflags) == 0;
    if (terminal) {
        struct termios nflags = oflags;
        nflags.c_lflag &= ~ECHO;
        nflags.c_lflag |= ECHONL;
        if (tcsetattr(fileno(in), TCSANOW, &nflags) != 0) {
            if (in != stdin) {
                std::fclose(in);
            }
            return std::nullopt;
        }
    }

    std::fputs(prompt.c_str(), out);
    std::fflush(out);

    std::string line;
    bool gotInput = false;
    for (int c = std::fgetc(in); c != EOF; c = std::fgetc(in)) {
        gotInput = true;
        if (c == '\n') {
            break;
        }
        line.push_back(static_cast<char>(c));
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // A signal interrupts fgetc with EINTR; treat it as giving up.
    bool interrupted = std::ferror(in) != 0;
    if (interrupted) {
        std::fputc('\n', out);
        std::fflush(out);
        secureWipe(line.data(), line.size());
    }

    if (terminal) {
        tcsetattr(fileno(in), TCSANOW, &oflags);
    }
    if (in != stdin) {
        std::fclose(in);
    } else {
        std::clearerr(in);
    }
    if (interrupted || !gotInput) {
        return std::nullopt;
    }
    return Secret(std::move(line));
}

PasswordRequest terminalPasswordPrompt() {
    return [](PasswordPurpose purpose, int attempt, int maxAttempts) -> std::optional<Secret> {
        std::string suffix = attempt > 1 ? std::format(" (attempt {}/{})", attempt, maxAttempts) : std::string();
        if (purpose == PasswordPurpose::Unlock) {
            return readHiddenLine(std::format("Enter archive password{}: ", suffix));
        }

        auto password = readHiddenLine(std::format("Enter archive password{}: ", suffix));
        if (!password) {
            return std::nullopt;
        }
        if (password->empty()) {
            std::println(stderr, "Error: Password cannot be empty");
            return password;
        }
        auto confirmation = readHiddenLine("Confirm password: ");
        if (!confirmation) {
            return std::nullopt;
        }
        if (!password->matches(*confirmation)) {
            std::println(stderr, "Error: Passwords do not match");
            return Secret();
        }
        std::println("Password set");
        return password;
    };
}
