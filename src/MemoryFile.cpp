#include "MemoryFile.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

#include <json/json.h>

namespace MemoryFile {

    // Parse one category object; false if it is not a {string: number} object
    static bool readEntries(const Json::Value& node, Memory::Entries& out) {
        if (!node.isObject()) return false;
        for (const std::string& text : node.getMemberNames()) {
            const Json::Value& score = node[text];
            if (!score.isNumeric()) return false;
            out[text] = score.asDouble();
        }
        return true;
    }

    LoadStatus load(const std::string& path, Memory& memory) {
        Logger logger("MemoryFile");
        memory.clear();

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            logger.logInfo("No snapshot at " + path + ", starting empty");
            return LoadStatus::ABSENT;
        }

        std::ifstream in(path);
        if (!in) {
            logger.logWarning("Cannot open " + path + ", starting empty");
            return LoadStatus::CORRUPT;
        }

        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        if (!Json::parseFromStream(builder, in, &root, &errors)) {
            logger.logWarning("Malformed snapshot " + path + ": " + errors);
            return LoadStatus::CORRUPT;
        }
        if (!root.isObject()) {
            logger.logWarning("Malformed snapshot " + path + ": top level is not an object");
            return LoadStatus::CORRUPT;
        }

        Memory restored(memory.banThreshold());
        for (Category category : ALL_CATEGORIES) {
            const char* name = categoryName(category);
            if (!root.isMember(name)) continue;

            Memory::Entries entries;
            if (!readEntries(root[name], entries)) {
                logger.logWarning("Malformed snapshot " + path + ": bad '" + name + "' section");
                return LoadStatus::CORRUPT;
            }

            // Kept (operator overrides), but never listed as allowed
            for (const auto& [text, score] : entries) {
                if (restored.isBanned(score)) {
                    logger.logWarning("Snapshot " + path + ": '" + text + "' in " + name
                                      + " is at or above the ban line (" + std::to_string(score) + ")");
                }
            }
            restored.set(category, std::move(entries));
        }

        memory = std::move(restored);
        logger.logInfo("Loaded snapshot " + path);
        return LoadStatus::LOADED;
    }

    bool save(const std::string& path, const Memory& memory) {
        Logger logger("MemoryFile");

        std::filesystem::path file(path);
        if (file.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(file.parent_path(), ec);
            if (ec) {
                logger.logError("Cannot create " + file.parent_path().string() + ": " + ec.message());
                return false;
            }
        }

        Json::Value root(Json::objectValue);
        for (Category category : ALL_CATEGORIES) {
            Json::Value section(Json::objectValue);
            for (const auto& [text, score] : memory.get(category)) {
                section[text] = score;
            }
            root[categoryName(category)] = section;
        }

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        builder["precision"] = 17;
        builder["emitUTF8"] = true;

        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            logger.logError("Cannot write " + path);
            return false;
        }

        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(root, &out);
        out << '\n';
        if (!out) {
            logger.logError("Write failed for " + path);
            return false;
        }
        return true;
    }

} // namespace MemoryFile
