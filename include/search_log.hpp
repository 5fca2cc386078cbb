#pragma once

#include <fstream>
#include <string>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>

namespace fs = std::filesystem;

class SearchLog {
private:
    std::string filename_;
    bool fileExists_;

    // Timestamp and date columns come from the same clock reading
    static std::string formatTime(const std::tm& tm, const char* format) {
        std::ostringstream oss;
        oss << std::put_time(&tm, format);
        return oss.str();
    }

    // CSV fields are quoted; embedded quotes doubled
    static std::string quoted(const std::string& text) {
        std::string out = "\"";
        for (char c : text) {
            if (c == '"') out += '"';
            out += c;
        }
        out += '"';
        return out;
    }

public:
    explicit SearchLog(const std::string& baseDir) : fileExists_(false) {
        std::error_code ec;
        fs::create_directories(baseDir, ec);
        filename_ = baseDir + "/search_log.csv";
        fileExists_ = fs::exists(filename_, ec);
    }

    const std::string& filename() const { return filename_; }

    bool logSearch(const std::string& pattern, int workers, const std::string& alphabet,
                   const std::string& status, long long attempts, double time,
                   const std::string& resultId) {
        std::ofstream file(filename_, std::ios::app);
        if (!file) {
            return false;
        }

        if (!fileExists_) {
            file << "timestamp,date,pattern,workers,alphabet,status,attempts,time_s,attempts_per_s,result\n";
            fileExists_ = true;
        }

        const double rate = time > 0.0 ? attempts / time : 0.0;
        const auto now = std::time(nullptr);
        const std::tm tm = *std::localtime(&now);

        file << formatTime(tm, "%Y-%m-%d %H:%M:%S") << ","
             << formatTime(tm, "%Y-%m-%d") << ","
             << quoted(pattern) << ","
             << workers << ","
             << quoted(alphabet) << ","
             << status << ","
             << attempts << ","
             << std::fixed << std::setprecision(5) << time << ","
             << std::setprecision(1) << rate << ","
             << resultId << "\n";
        return static_cast<bool>(file);
    }
};
