#pragma once

#include <string>
#include <utility>
#include <vector>

// Owns a copy of the process arguments so they can be handed to config
// backends after main() returns control.
class CommandLine {
   public:
    CommandLine(int argc, char *argv[]) {
        arguments_.reserve(argc);
        for (int i = 0; i < argc; ++i) {
            arguments_.emplace_back(argv[i]);
        }
        rebuildPointers();
    }

    explicit CommandLine(std::vector<std::string> arguments)
        : arguments_(std::move(arguments)) {
        rebuildPointers();
    }

    CommandLine(const CommandLine &other) : arguments_(other.arguments_) {
        rebuildPointers();
    }
    CommandLine &operator=(const CommandLine &other) {
        if (this != &other) {
            arguments_ = other.arguments_;
            rebuildPointers();
        }
        return *this;
    }
    CommandLine(CommandLine &&other) noexcept
        : arguments_(std::move(other.arguments_)) {
        rebuildPointers();
    }

    [[nodiscard]] int argc() const { return static_cast<int>(argv_.size()); }
    [[nodiscard]] const char *const *argv() const { return argv_.data(); }
    [[nodiscard]] const std::vector<std::string> &arguments() const {
        return arguments_;
    }
    std::string operator[](int i) const { return arguments_.at(i); }

   private:
    void rebuildPointers() {
        argv_.clear();
        argv_.reserve(arguments_.size());
        for (const auto &arg : arguments_) {
            argv_.emplace_back(arg.c_str());
        }
    }

    std::vector<std::string> arguments_;
    std::vector<const char *> argv_;
};
