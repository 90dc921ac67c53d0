#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

// Helpers for command lines that take biological file formats: VCF and
// BAM/CRAM inputs given directly or through text files listing one path
// per line.

enum class FileType { Bam, Vcf, List, Missing };

const char* file_type_name(FileType type);

// .bam/.cram -> Bam; *.vcf, *.vcf.gz or a "##fileformat=VCF" first line -> Vcf;
// anything else -> List.
FileType detect_file_type(const std::string& path);

// Resolve inputs to concrete files grouped by type. List files are expanded
// recursively (trailing whitespace trimmed, blank lines skipped). Inputs
// found neither as given nor with a .gz suffix land under Missing.
std::map<FileType, std::vector<std::string>> vcf_bam_args(const std::vector<std::string>& inputs);

// "Missing required option: <name>" for each required option not present.
std::vector<std::string> check_missing(const std::set<std::string>& options,
                                       const std::vector<std::string>& required);

// Error report for a failed command line parse.
std::string error_msg(const std::vector<std::string>& errors);
