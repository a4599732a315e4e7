#pragma once

#include "download_spec.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace parafetch {

class ManifestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ManifestEntry {
    std::string url;
    std::optional<std::string> file_name;
    std::optional<std::uint64_t> expected_size;
};

// TOML document with a `downloads` array of tables:
//
//   [[downloads]]
//   url = "https://example.com/a.iso"
//   file_name = "a.iso"        # optional
//   expected_size = 1048576    # optional
//
// The inline form `downloads = [{ url = "..." }]` is accepted too. Unknown
// keys are ignored.
std::vector<ManifestEntry> parseManifest(std::string_view document, std::string_view source = "manifest");
std::vector<ManifestEntry> loadManifest(const std::filesystem::path& path);

// Last non-empty path segment of the URL, or "index.html".
std::string defaultFileName(const std::string& url);

DownloadSpecs toSpecs(const std::vector<ManifestEntry>& entries, const std::filesystem::path& out_dir);

} // namespace parafetch
