#pragma once

#include <string>

#include "storage/memory_store.hpp"

namespace tracemark::storage
{

// Memory store mirrored to one JSON document:
//   {"version": 1, "entries": [{"metadata": {...},
//                               "markings": [{"start", "end", "label", "note"}],
//                               "tags": [{"start", "end", "tag"}]}]}
// Every successful mutation rewrites the file.
class JsonFileMarkingStore : public MemoryMarkingStore
{
   public:
    // Reads `path` if it exists. A missing file is an empty store; an unreadable one
    // leaves the store empty, sets error() and makes every mutator fail until a
    // later reload() succeeds.
    explicit JsonFileMarkingStore(std::string path);

    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }
    bool               writable() const { return !unreadable_ && !read_only(); }

    bool reload();

    static std::string serialize(const std::map<std::string, Entry>& entries);
    // Returns false and leaves `out` untouched on malformed input.
    static bool deserialize(const std::string&            text,
                            std::map<std::string, Entry>& out,
                            std::string&                  error);

   protected:
    bool commit() override;

   private:
    std::string path_;
    std::string error_;
    bool        unreadable_ = false;
};

}   // namespace tracemark::storage
