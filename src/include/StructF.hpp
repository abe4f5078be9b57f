#pragma once

#include <absl/log/absl_log.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

// Owning wrapper around a stdio FILE*, closed when it goes out of scope.
struct F {
    using size_type = size_t;

    F() = default;
    F(const F&) = delete;
    F& operator=(const F&) = delete;
    F(F&& other) noexcept = default;
    F& operator=(F&& other) noexcept = default;

    /**
     * @enum Mode
     * @brief File access modes, mapped 1:1 onto fopen(3) mode strings.
     */
    enum class Mode : std::int8_t {
        Read = 1,
        Write = 1 << 1,
        Append = 1 << 2,
        BinaryMask = 1 << 3,

        ReadBinary = Read | BinaryMask,
        WriteBinary = Write | BinaryMask,
        AppendBinary = Append | BinaryMask,
    };

    struct Result {
        bool success;
        enum class Reason : std::int8_t {
            kNone,
            kHandleNull,
            kIOFailure,
        } reason;

        operator bool() const { return success; }

        static Result ok() {
            return Result{.success = true, .reason = Reason::kNone};
        }
        static Result error(Reason reason) {
            return Result{.success = false, .reason = reason};
        }
        static Result ok_or(const bool cond, const Reason ifFailed) {
            return cond ? Result::ok() : Result::error(ifFailed);
        }
    };

    /**
     * @brief Opens a file, closing any previously held handle first.
     *
     * @return `Result::ok()` on success, `Reason::kIOFailure` if fopen failed.
     */
    [[nodiscard]] Result open(const std::filesystem::path& filename,
                              const Mode mode);

    /**
     * @brief Writes exactly `nBytes` bytes from `ptr`.
     *
     * @return `Reason::kHandleNull` if no file is open, `Reason::kIOFailure`
     * on a short write.
     */
    [[nodiscard]] Result write(const void* __restrict ptr,
                               size_t nBytes) const;

    /**
     * @brief Reads up to `nBytes` bytes into `ptr`.
     *
     * A return value smaller than `nBytes` means end of file or an error,
     * distinguish the two with error().
     */
    [[nodiscard]] size_type readSome(void* ptr, size_t nBytes) const;

    // True if the last operation on the stream failed.
    [[nodiscard]] bool error() const {
        return handle != nullptr && std::ferror(handle.get()) != 0;
    }

    // Writes a string without a trailing newline.
    [[nodiscard]] Result puts(const std::string_view text) const {
        return write(text.data(), text.size());
    }

    [[nodiscard]] Result flush() const;

    // flush() and fsync(2).
    [[nodiscard]] Result sync() const;

    [[nodiscard]] Result rewind() const;

    Result close();

    // Size of the underlying file in bytes, or INVALID_SIZE.
    [[nodiscard]] size_type size() const;

    constexpr static size_type INVALID_SIZE = -1;

   private:
    struct Closer {
        void operator()(FILE* file) const { std::fclose(file); }
    };
    std::unique_ptr<FILE, Closer> handle;

    [[nodiscard]] bool checkHandle() const {
        if (handle == nullptr) {
            ABSL_LOG(ERROR) << "File handle is null";
            return false;
        }
        return true;
    }

    static const char* constructFileMode(const Mode mode);
};

inline F::Result F::open(const std::filesystem::path& filename,
                         const Mode mode) {
    if (Result closeRes = close(); !closeRes) {
        return closeRes;
    }
    handle.reset(std::fopen(filename.c_str(), constructFileMode(mode)));
    if (handle == nullptr) {
        ABSL_PLOG(ERROR) << "Failed to open file: "
                         << std::quoted(filename.string());
        return Result::error(Result::Reason::kIOFailure);
    }
    return Result::ok();
}

inline F::Result F::write(const void* __restrict ptr, size_t nBytes) const {
    if (!checkHandle()) {
        return Result::error(Result::Reason::kHandleNull);
    }
    if (nBytes == 0) {
        return Result::ok();
    }
    return Result::ok_or(std::fwrite(ptr, 1, nBytes, handle.get()) == nBytes,
                         Result::Reason::kIOFailure);
}

inline F::size_type F::readSome(void* ptr, size_t nBytes) const {
    if (!checkHandle()) {
        return 0;
    }
    return std::fread(ptr, 1, nBytes, handle.get());
}

inline F::Result F::flush() const {
    if (!checkHandle()) {
        return Result::error(Result::Reason::kHandleNull);
    }
    return Result::ok_or(std::fflush(handle.get()) == 0,
                         Result::Reason::kIOFailure);
}

inline F::Result F::sync() const {
    if (auto res = flush(); !res) {
        return res;
    }
    if (::fsync(::fileno(handle.get())) != 0) {
        ABSL_PLOG(ERROR) << "fsync failed";
        return Result::error(Result::Reason::kIOFailure);
    }
    return Result::ok();
}

inline F::Result F::rewind() const {
    if (!checkHandle()) {
        return Result::error(Result::Reason::kHandleNull);
    }
    return Result::ok_or(std::fseek(handle.get(), 0, SEEK_SET) == 0,
                         Result::Reason::kIOFailure);
}

inline F::Result F::close() {
    if (handle == nullptr) {
        return Result::ok();
    }
    if (std::fclose(handle.release()) != 0) {
        ABSL_PLOG(ERROR) << "Failed to close file";
        return Result::error(Result::Reason::kIOFailure);
    }
    return Result::ok();
}

inline F::size_type F::size() const {
    if (!checkHandle()) {
        return INVALID_SIZE;
    }
    struct stat info {};
    if (::fstat(::fileno(handle.get()), &info) != 0) {
        ABSL_PLOG(ERROR) << "fstat failed";
        return INVALID_SIZE;
    }
    return static_cast<size_type>(info.st_size);
}

inline const char* F::constructFileMode(const Mode mode) {
    switch (mode) {
        case Mode::Read:
            return "r";
        case Mode::Write:
            return "w";
        case Mode::Append:
            return "a";
        case Mode::ReadBinary:
            return "rb";
        case Mode::WriteBinary:
            return "wb";
        case Mode::AppendBinary:
            return "ab";
        default:
            ABSL_LOG(ERROR) << "Invalid file mode: " << static_cast<int>(mode);
            return "";
    }
}
