#include "file_info.hpp"

std::vector<Arg> substitute_keys(const std::vector<Arg>& args, const FileInfo& file_info) {
    std::vector<Arg> out;
    out.reserve(args.size());
    for (const auto& arg : args) {
        if (const Slot* slot = std::get_if<Slot>(&arg)) {
            auto it = file_info.find(slot->name);
            if (it != file_info.end()) {
                out.emplace_back(it->second);
                continue;
            }
        }
        out.push_back(arg);
    }
    return out;
}

std::string render_args(const std::vector<Arg>& args) {
    std::string cmd;
    for (const auto& arg : args) {
        if (!cmd.empty()) cmd += ' ';
        if (const Slot* slot = std::get_if<Slot>(&arg)) {
            cmd += ':' + slot->name;
        } else {
            cmd += std::get<std::string>(arg);
        }
    }
    return cmd;
}

std::vector<std::string> paths_for(const FileInfo& file_info, const std::vector<std::string>& keys) {
    std::vector<std::string> paths;
    for (const auto& key : keys) {
        auto it = file_info.find(key);
        if (it != file_info.end()) paths.push_back(it->second);
    }
    return paths;
}
