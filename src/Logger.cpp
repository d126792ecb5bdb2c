#include "Logger.hpp"
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <mutex>

#include <string>

// Serialize concurrent file writes across all Logger instances
static std::mutex g_log_file_mutex;
static std::string g_log_file = "logs/pyx.log";

// Sanitize a log entry (drop ASCII control bytes, keep UTF-8, cap length)
static std::string sanitize_line(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 32 && c != 127) || c == '\t')
            out.push_back(static_cast<char>(c));
        // drop other control/binary
    }

    // Cap length
    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        size_t cut = kMax;
        // Do not split a UTF-8 sequence
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80)
            --cut;
        out.resize(cut);
        out += "...";
    }
    return out;
}


// Create a new logger object for the given component
Logger::Logger(std::string component){
    this->component = component;
}

void Logger::setLogFile(std::string path){
    std::lock_guard<std::mutex> lock(g_log_file_mutex);
    g_log_file = path;
}

std::string Logger::getLogFile(){
    std::lock_guard<std::mutex> lock(g_log_file_mutex);
    return g_log_file;
}

const std::string Logger::getTime(){
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::system_clock::now());
}

std::string Logger::format(const std::string& level, const std::string& entry){
    return getTime() + " [" + this->component + "] " + level + ": " + sanitize_line(entry);
}

void Logger::logInfo(std::string entry){
    logToFile(format("INFO", entry));
}

void Logger::logWarning(std::string entry){
    std::string log = format("WARNING", entry);
    std::cerr << log << std::endl;
    logToFile(log);
}

void Logger::logError(std::string entry){
    std::string log = format("ERROR", entry);
    std::cerr << log << std::endl;
    logToFile(log);
}

void Logger::logTraining(std::string text, bool safe, double loss){
    logToFile(format("INFO", fmt::format("Trained '{}' as {} (loss {:.4f})", text, safe ? "SAFE" : "BAD", loss)));
}

void Logger::logDecision(std::string text, bool safe, double score){
    logToFile(format("INFO", fmt::format("Decided '{}' is {} (score {:.3f})", text, safe ? "SAFE" : "INAPPROPRIATE", score)));
}


void Logger::logToFile(std::string entry){
    std::lock_guard<std::mutex> lock(g_log_file_mutex); //Guard concurrent appends.

    // Ensure the log directory exists (safe if it already exists)
    std::filesystem::path path(g_log_file);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream out(g_log_file, std::ios::app); //Open in append mode
    if (!out){
        std::cerr << "[Logger] ERROR: cannot open " << g_log_file << "\n";
        return;
    }
    out << entry << '\n';
}
