#include "warden/pid_record.hpp"

#include "warden/exceptions.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace warden
{

namespace fs = std::filesystem;

static std::string errno_message()
{
    return std::strerror(errno);
}

// =============================================================================
// Lock
// =============================================================================

PidRecord::Lock::~Lock()
{
    release();
}

PidRecord::Lock::Lock(Lock&& other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

PidRecord::Lock& PidRecord::Lock::operator=(Lock&& other) noexcept
{
    if (this != &other)
    {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void PidRecord::Lock::release()
{
    if (fd_ >= 0)
    {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

// =============================================================================
// PidRecord
// =============================================================================

PidRecord::PidRecord(fs::path path) : path_(std::move(path)) {}

fs::path PidRecord::lock_path() const
{
    fs::path p = path_;
    p += ".lock";
    return p;
}

std::optional<int> PidRecord::read() const
{
    std::ifstream in(path_);
    if (!in.is_open())
    {
        std::error_code ec;
        if (!fs::exists(path_, ec))
            return std::nullopt;
        throw RecordError("Cannot read PID record " + path_.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string text = buffer.str();

    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    std::string digits = text.substr(begin, end - begin);

    if (digits.empty() || digits.size() > 10)
        throw RecordError("PID record " + path_.string() + " is corrupt: \"" + digits + "\"");
    for (char c : digits)
        if (!std::isdigit(static_cast<unsigned char>(c)))
            throw RecordError("PID record " + path_.string() + " is corrupt: \"" + digits + "\"");

    long long pid = std::stoll(digits);
    if (pid <= 0 || pid > 0x7fffffffLL)
        throw RecordError("PID record " + path_.string() + " holds an invalid pid: " + digits);
    return static_cast<int>(pid);
}

void PidRecord::write(int pid)
{
    if (pid <= 0)
        throw RecordError("Refusing to record invalid pid " + std::to_string(pid));

    std::error_code ec;
    if (path_.has_parent_path())
    {
        fs::create_directories(path_.parent_path(), ec);
        if (ec)
            throw RecordError("Cannot create directory for PID record " + path_.string() + ": " +
                              ec.message());
    }

    fs::path tmp = path_;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        throw RecordError("Cannot write PID record " + tmp.string() + ": " + errno_message());

    std::string text = std::to_string(pid) + "\n";
    ssize_t written = ::write(fd, text.data(), text.size());
    if (written != static_cast<ssize_t>(text.size()) || ::fsync(fd) != 0)
    {
        std::string message = errno_message();
        ::close(fd);
        ::unlink(tmp.c_str());
        throw RecordError("Cannot write PID record " + tmp.string() + ": " + message);
    }
    ::close(fd);

    if (::rename(tmp.c_str(), path_.c_str()) != 0)
    {
        std::string message = errno_message();
        ::unlink(tmp.c_str());
        throw RecordError("Cannot replace PID record " + path_.string() + ": " + message);
    }
}

bool PidRecord::remove()
{
    std::error_code ec;
    bool removed = fs::remove(path_, ec);
    if (ec)
        throw RecordError("Cannot remove PID record " + path_.string() + ": " + ec.message());
    return removed;
}

bool PidRecord::exists() const
{
    std::error_code ec;
    return fs::exists(path_, ec);
}

std::optional<std::chrono::system_clock::time_point> PidRecord::modified_at() const
{
    struct stat st;
    if (::stat(path_.c_str(), &st) != 0)
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(st.st_mtime);
}

PidRecord::Lock PidRecord::lock()
{
    fs::path lp = lock_path();
    std::error_code ec;
    if (lp.has_parent_path())
        fs::create_directories(lp.parent_path(), ec);

    int fd = ::open(lp.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
        throw RecordError("Cannot open lock file " + lp.string() + ": " + errno_message());

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK)
            throw RecordBusyError("Another invocation is operating on " + path_.string());
        throw RecordError("Cannot lock " + lp.string() + ": " + std::strerror(err));
    }
    return Lock(fd);
}

} // namespace warden
