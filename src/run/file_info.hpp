#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

// Symbolic output slot, e.g. Slot{"out"}, standing in for a path in an
// argument list until a FileInfo resolves it.
struct Slot {
    std::string name;

    bool operator==(const Slot& other) const { return name == other.name; }
    bool operator!=(const Slot& other) const { return name != other.name; }
};

// Command argument: literal text or a slot reference.
using Arg = std::variant<std::string, Slot>;

// Slot name -> file path. Owned by the caller; staging produces copies.
using FileInfo = std::map<std::string, std::string>;

// Replace every Slot present in file_info with its path. Literals and
// unknown slots pass through unchanged.
std::vector<Arg> substitute_keys(const std::vector<Arg>& args, const FileInfo& file_info);

// Render arguments as a space-separated command line. Unresolved slots
// render as ":name".
std::string render_args(const std::vector<Arg>& args);

// Paths for the given keys, in key order; keys absent from file_info are skipped.
std::vector<std::string> paths_for(const FileInfo& file_info, const std::vector<std::string>& keys);
