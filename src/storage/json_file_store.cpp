#include "storage/json_file_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <tracemark/logger.hpp>

#include "io/json_util.hpp"

namespace tracemark::storage
{

namespace
{

std::string metadata_value_json(const MetadataValue& value)
{
    if (const bool* b = std::get_if<bool>(&value))
        return *b ? "true" : "false";
    if (const int64_t* i = std::get_if<int64_t>(&value))
        return std::to_string(*i);
    if (const double* d = std::get_if<double>(&value))
        return json::format_double(*d);
    return "\"" + json::escape(std::get<std::string>(value)) + "\"";
}

std::optional<MetadataValue> parse_metadata_value(const std::string& raw)
{
    if (json::is_string(raw))
    {
        if (auto s = json::as_string(raw))
            return MetadataValue{*s};
        return std::nullopt;
    }
    if (auto b = json::as_bool(raw))
        return MetadataValue{*b};
    if (json::is_integer(raw))
    {
        char*     end = nullptr;
        long long v   = std::strtoll(raw.c_str(), &end, 10);
        if (end && *end == '\0')
            return MetadataValue{static_cast<int64_t>(v)};
    }
    if (auto d = json::as_number(raw))
        return MetadataValue{*d};
    return std::nullopt;
}

}   // namespace

JsonFileMarkingStore::JsonFileMarkingStore(std::string path) : path_(std::move(path))
{
    reload();
}

bool JsonFileMarkingStore::reload()
{
    error_.clear();
    unreadable_ = false;
    std::ifstream f(path_);
    if (!f.is_open())
    {
        replace_entries({});
        return true;
    }

    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    std::map<std::string, Entry> entries;
    if (!deserialize(text, entries, error_))
    {
        TRACEMARK_LOG_ERROR("io", "Cannot read markings from {}: {}", path_, error_);
        replace_entries({});
        unreadable_ = true;
        return false;
    }
    TRACEMARK_LOG_DEBUG("io", "Read {} marking entries from {}", entries.size(), path_);
    replace_entries(std::move(entries));
    return true;
}

bool JsonFileMarkingStore::commit()
{
    // The file on disk still holds data we could not read; rewriting it would drop that.
    if (unreadable_)
    {
        TRACEMARK_LOG_ERROR("io", "Refusing to overwrite unreadable markings file {}", path_);
        return false;
    }

    std::error_code ec;
    auto            dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);

    // Write to a sibling file first so a failed write never truncates the store.
    std::string   tmp = path_ + ".tmp";
    std::ofstream f(tmp, std::ios::trunc);
    if (!f.is_open())
    {
        error_ = "cannot open " + tmp;
        TRACEMARK_LOG_ERROR("io", "Cannot write markings: {}", error_);
        return false;
    }
    f << serialize(entries());
    f.close();
    if (!f)
    {
        error_ = "write to " + tmp + " failed";
        TRACEMARK_LOG_ERROR("io", "Cannot write markings: {}", error_);
        return false;
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec)
    {
        error_ = ec.message();
        TRACEMARK_LOG_ERROR("io", "Cannot replace {}: {}", path_, error_);
        return false;
    }
    error_.clear();
    return true;
}

// ─── Serialization ───────────────────────────────────────────────────────────

std::string JsonFileMarkingStore::serialize(const std::map<std::string, Entry>& entries)
{
    std::ostringstream os;
    os << "{\n  \"version\": 1,\n  \"entries\": [";
    bool first_entry = true;
    for (const auto& [key, entry] : entries)
    {
        os << (first_entry ? "\n" : ",\n");
        first_entry = false;

        os << "    {\n      \"metadata\": {";
        bool first_key = true;
        for (const auto& [name, value] : entry.metadata)
        {
            if (!first_key)
                os << ", ";
            first_key = false;
            os << "\"" << json::escape(name) << "\": " << metadata_value_json(value);
        }
        os << "},\n      \"markings\": [";

        for (size_t i = 0; i < entry.markings.size(); ++i)
        {
            const auto& m = entry.markings[i];
            os << (i > 0 ? ",\n" : "\n");
            os << "        {\"start\": " << json::format_double(m.start)
               << ", \"end\": " << json::format_double(m.end) << ", \"label\": \""
               << label_id(m.label) << "\", \"note\": ";
            if (m.note)
                os << "\"" << json::escape(*m.note) << "\"";
            else
                os << "null";
            os << "}";
        }
        os << (entry.markings.empty() ? "]" : "\n      ]");
        os << ",\n      \"tags\": [";

        for (size_t i = 0; i < entry.tags.size(); ++i)
        {
            const auto& t = entry.tags[i];
            os << (i > 0 ? ", " : "");
            os << "{\"start\": " << json::format_double(t.start)
               << ", \"end\": " << json::format_double(t.end) << ", \"tag\": \""
               << json::escape(t.tag) << "\"}";
        }
        os << "]\n    }";
    }
    os << (entries.empty() ? "]\n}\n" : "\n  ]\n}\n");
    return os.str();
}

bool JsonFileMarkingStore::deserialize(const std::string&            text,
                                       std::map<std::string, Entry>& out,
                                       std::string&                  error)
{
    auto root = json::object_members(text);
    if (root.empty())
    {
        error = "not a JSON object";
        return false;
    }
    if (json::read_number(root, "version", 1.0) > 1.0)
    {
        error = "unsupported version";
        return false;
    }

    const std::string* entries_raw = json::find(root, "entries");
    if (!entries_raw)
    {
        error = "missing \"entries\"";
        return false;
    }

    std::map<std::string, Entry> result;
    for (const auto& entry_raw : json::array_elements(*entries_raw))
    {
        auto members = json::object_members(entry_raw);

        Entry entry;
        if (const std::string* meta_raw = json::find(members, "metadata"))
        {
            for (const auto& member : json::object_members(*meta_raw))
            {
                auto value = parse_metadata_value(member.raw);
                if (!value)
                {
                    error = "bad metadata value for \"" + member.key + "\"";
                    return false;
                }
                entry.metadata.emplace(member.key, std::move(*value));
            }
        }

        if (const std::string* markings_raw = json::find(members, "markings"))
        {
            for (const auto& marking_raw : json::array_elements(*markings_raw))
            {
                auto fields = json::object_members(marking_raw);
                auto start  = json::find(fields, "start");
                auto end    = json::find(fields, "end");
                if (!start || !end || !json::as_number(*start) || !json::as_number(*end))
                {
                    error = "marking without numeric start/end";
                    return false;
                }
                auto label = parse_label(json::read_string(fields, "label"));
                if (!label)
                {
                    error = "unknown label \"" + json::read_string(fields, "label") + "\"";
                    return false;
                }

                MarkingRecord record;
                record.start = *json::as_number(*start);
                record.end   = *json::as_number(*end);
                record.label = *label;
                const std::string* note = json::find(fields, "note");
                if (note && !json::is_null(*note))
                    record.note = json::as_string(*note);
                entry.markings.push_back(std::move(record));
            }
        }

        if (const std::string* tags_raw = json::find(members, "tags"))
        {
            for (const auto& tag_raw : json::array_elements(*tags_raw))
            {
                auto           fields = json::object_members(tag_raw);
                TaggedInterval interval;
                interval.start = json::read_number(fields, "start", 0.0);
                interval.end   = json::read_number(fields, "end", 0.0);
                interval.tag   = json::read_string(fields, "tag");
                entry.tags.push_back(std::move(interval));
            }
        }

        std::string key = metadata_to_string(entry.metadata);
        result[key]     = std::move(entry);
    }

    out = std::move(result);
    return true;
}

}   // namespace tracemark::storage
