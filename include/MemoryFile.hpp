#ifndef MEMORY_FILE_HPP
#define MEMORY_FILE_HPP

#include <string>

#include "Memory.hpp"

/**
 * Whole-snapshot persistence of a Memory store as JSON:
 *
 *   { "words": { "<text>": <score>, ... }, "phrases": {...}, "game_ideas": {...} }
 */
namespace MemoryFile {

    enum class LoadStatus {
        LOADED  = 0,
        ABSENT  = 1,    // No file yet; store left empty
        CORRUPT = 2     // File present but unreadable; store left empty
    };

    /**
     * Replace the contents of memory with the snapshot at path
     *
     * A missing category field loads as an empty mapping. On CORRUPT the
     * store is cleared and a warning is logged. Entries at or above the ban
     * line are loaded as-is and each one is logged as a warning.
     */
    LoadStatus load(const std::string& path, Memory& memory);

    /**
     * Write every category of memory to path, creating parent directories
     * @return false if the file could not be written
     */
    bool save(const std::string& path, const Memory& memory);

} // namespace MemoryFile

#endif // MEMORY_FILE_HPP
