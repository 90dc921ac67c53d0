#include "file_args.hpp"
#include <core/path_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>

const char* file_type_name(FileType type) {
    switch (type) {
        case FileType::Bam:     return "bam";
        case FileType::Vcf:     return "vcf";
        case FileType::List:    return "list";
        case FileType::Missing: return "missing";
    }
    return "unknown";
}

static bool is_bam(const std::string& f) {
    return ends_with(f, ".bam") || ends_with(f, ".cram");
}

static bool is_vcf(const std::string& f) {
    if (ends_with(f, ".vcf") || ends_with(f, ".vcf.gz")) return true;
    std::ifstream in(f);
    std::string first;
    if (!in || !std::getline(in, first)) return false;
    return starts_with(first, "##fileformat=VCF");
}

static bool is_regular(const std::string& f) {
    return file_exists(f) && !is_directory(f);
}

FileType detect_file_type(const std::string& path) {
    if (is_bam(path)) return FileType::Bam;
    if (is_vcf(path)) return FileType::Vcf;
    return FileType::List;
}

static void expand_input(const std::string& f,
                         std::vector<std::pair<FileType, std::string>>& out,
                         int depth) {
    if (!is_regular(f) && !is_regular(f + ".gz")) {
        out.emplace_back(FileType::Missing, f);
        return;
    }
    // Plain file missing but f.gz present: the compressed copy is the input.
    std::string actual = is_regular(f) ? f : f + ".gz";
    FileType type = detect_file_type(actual);
    if (type != FileType::List) {
        out.emplace_back(type, f);
        return;
    }
    // Guard against list files that (indirectly) list themselves.
    if (depth > 32) {
        out.emplace_back(FileType::Missing, f);
        return;
    }

    std::ifstream in(actual);
    std::string line;
    while (std::getline(in, line)) {
        trim_right(line);
        if (line.empty()) continue;
        expand_input(line, out, depth + 1);
    }
}

std::map<FileType, std::vector<std::string>> vcf_bam_args(const std::vector<std::string>& inputs) {
    std::vector<std::pair<FileType, std::string>> resolved;
    for (const auto& f : inputs) {
        expand_input(f, resolved, 0);
    }

    std::map<FileType, std::vector<std::string>> by_type;
    for (auto& [type, path] : resolved) {
        by_type[type].push_back(std::move(path));
    }
    return by_type;
}

std::vector<std::string> check_missing(const std::set<std::string>& options,
                                       const std::vector<std::string>& required) {
    std::vector<std::string> msgs;
    for (const auto& opt : required) {
        if (options.count(opt) == 0) {
            msgs.push_back(fmt::format("Missing required option: {}", opt));
        }
    }
    return msgs;
}

std::string error_msg(const std::vector<std::string>& errors) {
    return "The following errors occurred while parsing your command:\n" + join(errors, "\n");
}
