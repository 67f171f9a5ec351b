#ifndef DASH_TESTS_TEST_HELPERS_HPP
#define DASH_TESTS_TEST_HELPERS_HPP

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <ftw.h>
#include <unistd.h>

namespace dash {
namespace test {

// Fresh directory under /tmp, removed recursively on destruction
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/dash_test_XXXXXX";
        char* created = mkdtemp(tmpl);
        path_ = created ? created : "";
    }
    ~TempDir() {
        if (!path_.empty()) {
            nftw(path_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
        }
    }

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    TempDir(const TempDir&);
    TempDir& operator=(const TempDir&);

    static int remove_entry(const char* fpath, const struct stat*, int, struct FTW*) {
        return ::remove(fpath);
    }

    std::string path_;
};

// Pins the local timezone for the lifetime of the object
class ScopedTimezone {
public:
    explicit ScopedTimezone(const char* tz) {
        const char* old = getenv("TZ");
        had_old_ = old != nullptr;
        if (had_old_) old_ = old;
        setenv("TZ", tz, 1);
        tzset();
    }
    ~ScopedTimezone() {
        if (had_old_) {
            setenv("TZ", old_.c_str(), 1);
        } else {
            unsetenv("TZ");
        }
        tzset();
    }

private:
    bool had_old_;
    std::string old_;
};

// UTC wall-clock time as unix milliseconds
inline int64_t utc_ms(int year, int month, int day, int hour, int minute, int second = 0) {
    struct tm t = {};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    return static_cast<int64_t>(timegm(&t)) * 1000;
}

const int64_t MINUTE_MS = 60 * 1000;
const int64_t HOUR_MS = 60 * MINUTE_MS;

} // namespace test
} // namespace dash

#endif // DASH_TESTS_TEST_HELPERS_HPP
