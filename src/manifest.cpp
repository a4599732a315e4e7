#include "parafetch/manifest.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <toml++/toml.hpp>

namespace parafetch {

namespace {

std::string entryError(std::size_t index, const toml::node& node, std::string_view message) {
    return fmt::format("downloads[{}] (line {}): {}", index, node.source().begin.line, message);
}

void checkFileName(const std::string& name, std::size_t index, const toml::node& node) {
    const std::filesystem::path path{name};
    if (name.empty() || path.is_absolute()) {
        throw ManifestError(entryError(index, node, fmt::format("file_name must be relative: '{}'", name)));
    }
    for (const auto& part : path) {
        if (part.string() == "..") {
            throw ManifestError(entryError(
                index, node, fmt::format("file_name may not leave the output directory: {}", name)));
        }
    }
}

ManifestEntry parseEntry(std::size_t index, const toml::node& node) {
    const toml::table* item = node.as_table();
    if (item == nullptr) {
        throw ManifestError(entryError(index, node, "expected a table"));
    }

    ManifestEntry entry;
    const toml::node* url = item->get("url");
    if (url == nullptr) {
        throw ManifestError(entryError(index, node, "missing url"));
    }
    if (url->as_string() == nullptr) {
        throw ManifestError(entryError(index, *url, "url must be a string"));
    }
    entry.url = url->as_string()->get();
    const auto scheme_end = entry.url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw ManifestError(entryError(index, *url, fmt::format("not a URL: {}", entry.url)));
    }

    if (const toml::node* file_name = item->get("file_name")) {
        if (file_name->as_string() == nullptr) {
            throw ManifestError(entryError(index, *file_name, "file_name must be a string"));
        }
        checkFileName(file_name->as_string()->get(), index, *file_name);
        entry.file_name = file_name->as_string()->get();
    }

    if (const toml::node* size = item->get("expected_size")) {
        const auto* value = size->as_integer();
        if (value == nullptr || value->get() < 0) {
            throw ManifestError(entryError(index, *size, "expected_size must be a non-negative integer"));
        }
        entry.expected_size = static_cast<std::uint64_t>(value->get());
    }
    return entry;
}

} // namespace

std::vector<ManifestEntry> parseManifest(std::string_view document, std::string_view source) {
    toml::table table;
    try {
        table = toml::parse(document, source);
    } catch (const toml::parse_error& err) {
        throw ManifestError(fmt::format("line {}: {}", err.source().begin.line, err.description()));
    }

    const toml::node* downloads = table.get("downloads");
    if (downloads == nullptr) {
        throw ManifestError("missing 'downloads' array");
    }
    const toml::array* list = downloads->as_array();
    if (list == nullptr) {
        throw ManifestError(fmt::format("line {}: 'downloads' must be an array of tables",
                                        downloads->source().begin.line));
    }

    std::vector<ManifestEntry> entries;
    entries.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        entries.push_back(parseEntry(i, (*list)[i]));
    }
    return entries;
}

std::vector<ManifestEntry> loadManifest(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ManifestError(fmt::format("cannot open manifest {}", path.string()));
    }
    const std::string document{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw ManifestError(fmt::format("failed to read manifest {}", path.string()));
    }
    try {
        return parseManifest(document, path.string());
    } catch (const ManifestError& ex) {
        throw ManifestError(fmt::format("{}: {}", path.string(), ex.what()));
    }
}

std::string defaultFileName(const std::string& url) {
    std::string path = url;
    if (const auto scheme_end = path.find("://"); scheme_end != std::string::npos) {
        path.erase(0, scheme_end + 3);
        // file:///x has an empty authority; anything else drops the host part.
        const auto slash = path.find('/');
        path = slash == std::string::npos ? std::string{} : path.substr(slash);
    }
    if (const auto cut = path.find_first_of("?#"); cut != std::string::npos) {
        path.erase(cut);
    }

    std::string last;
    std::istringstream segments(path);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (!segment.empty() && segment != "." && segment != "..") {
            last = segment;
        }
    }
    return last.empty() ? std::string{"index.html"} : last;
}

DownloadSpecs toSpecs(const std::vector<ManifestEntry>& entries, const std::filesystem::path& out_dir) {
    DownloadSpecs specs;
    specs.reserve(entries.size());
    for (const auto& entry : entries) {
        const std::string name = entry.file_name.value_or(defaultFileName(entry.url));
        specs.push_back({entry.url, (out_dir / name).string(), entry.expected_size});
    }
    return specs;
}

} // namespace parafetch
