#pragma once

#include <vector>
#include <filesystem>
#include <cstdint>
#include "types.hpp"
#include "unit.hpp"

namespace fs = std::filesystem;

// Read a size-info YAML file (sras_info.yaml / fq_gzs_info.yaml):
//
//   - SRX685892/SRR1557065/SRR1557065.sra:
//       readable_size: 2.4 GB
//       size: 2546696608
//
// MetadataMissing if the file is absent, unparsable, or an entry has no size.
Result<std::vector<RawInput>> read_size_info(const fs::path& file);

// Write the same format. Fills readable_size when empty.
Result<void> write_size_info(const fs::path& file, const std::vector<RawInput>& inputs);

// Scan a directory for *.fastq.gz files (sorted by name).
std::vector<RawInput> scan_fastq_gz(const fs::path& unit_dir);

// Total size of a unit's fastq.gz files, from fq_gzs_info.yaml. The file is
// created from a directory scan when missing. MetadataMissing if the unit
// directory does not exist.
Result<int64_t> fastq_gz_total(const fs::path& unit_dir, bool* created = nullptr);
