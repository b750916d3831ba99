#pragma once

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace keyreg::host {

    /// Destination for program log lines
    class LogSink {
      public:
        virtual ~LogSink() = default;
        virtual void log(const std::string &line) = 0;
    };

    /// Prints "Program log: <line>" to stdout
    class StdoutLogSink : public LogSink {
      public:
        inline void log(const std::string &line) override {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cout << "Program log: " << line << std::endl;
        }

      private:
        std::mutex mutex_;
    };

    /// Keeps log lines in memory
    class MemoryLogSink : public LogSink {
      public:
        inline void log(const std::string &line) override {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(line);
        }

        inline std::vector<std::string> lines() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return lines_;
        }

        inline bool contains(const std::string &fragment) const {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &line : lines_) {
                if (line.find(fragment) != std::string::npos)
                    return true;
            }
            return false;
        }

        inline void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.clear();
        }

      private:
        mutable std::mutex mutex_;
        std::vector<std::string> lines_;
    };

    /// Discards everything
    class NullLogSink : public LogSink {
      public:
        inline void log(const std::string &) override {}
    };

} // namespace keyreg::host
