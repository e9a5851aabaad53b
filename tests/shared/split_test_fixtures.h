#ifndef SPLIT_TEST_FIXTURES_H
#define SPLIT_TEST_FIXTURES_H

#include "../../documents/pgs_doc_sio.h"
#include "../../documents/pdf/pgs_pdf_sio.h"
#include "../../splitting/manifest/pgs_manifest.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

// ============================================================================
// IN-MEMORY DOCUMENT
// ============================================================================

// Paginated text document: one line per page. Extracting a page yields
// "page <index>\n<line>". Pages listed in failing_pages refuse extraction.
class memory_document : public pgs_doc_sio {
    std::vector<pgs_string> pages;
    bool opened = false;

public:
    std::set<size_t> failing_pages;
    mutable size_t extract_calls = 0;

    memory_document() = default;

    explicit memory_document(size_t page_count) {
        for (size_t i = 0; i < page_count; i++) {
            pages.push_back(pgs_string("content of page ") + pgs_string((unsigned long)i));
        }
        opened = true;
    }

    bool parse(pgs_string& data) override {
        pages.clear();
        std::istringstream lines(data.to_std_const());
        std::string line;
        while (std::getline(lines, line)) {
            pages.push_back(line);
        }
        opened = true;
        return true;
    }

    bool serialize(pgs_string& data) override {
        data.clear();
        for (const auto& page : pages) {
            data += page + "\n";
        }
        return opened;
    }

    bool is_open() const override { return opened; }
    void close() override { opened = false; }
    size_t page_count() const override { return opened ? pages.size() : 0; }

    bool extract_page(size_t page_index, pgs_string& data) override {
        extract_calls++;
        if (page_index >= pages.size()) {
            error_message = pgs_string("Page ") + pgs_string((unsigned long)page_index) + " does not exist";
            return false;
        }
        if (failing_pages.count(page_index) > 0) {
            error_message = pgs_string("Page ") + pgs_string((unsigned long)page_index) + " is damaged";
            return false;
        }
        data = pgs_string("page ") + pgs_string((unsigned long)page_index) + "\n" + pages[page_index];
        return true;
    }

    pgs_string file_extension() const override { return "txt"; }
};

// ============================================================================
// TEMPORARY DIRECTORIES
// ============================================================================

// Unique directory below the system temp dir, removed on destruction
class temp_dir {
    fs::path root;

public:
    temp_dir() {
        static std::atomic<int> counter(0);
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() /
               ("pagesplit_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(root);
    }

    ~temp_dir() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    const fs::path& path() const { return root; }
    pgs_string str() const { return root.string(); }
    pgs_string child(const std::string& name) const { return (root / name).string(); }
};

static inline pgs_string read_file(const pgs_string& path) {
    std::ifstream f(path.c_str(), std::ios::in | std::ios::binary);
    std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return pgs_string(data);
}

static inline void write_file(const pgs_string& path, const pgs_string& content) {
    std::ofstream f(path.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
    f.write(content.c_str(), (std::streamsize)content.size());
}

// Relative path -> content of every regular file below root
static inline std::map<std::string, std::string> snapshot_tree(const fs::path& root) {
    std::map<std::string, std::string> tree;
    if (!fs::exists(root)) {
        return tree;
    }
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            tree[fs::relative(entry.path(), root).generic_string()] = read_file(entry.path().string()).to_std();
        }
    }
    return tree;
}

// ============================================================================
// MANIFESTS AND PDF FIXTURES
// ============================================================================

static inline std::shared_ptr<const pgs_manifest> make_manifest(std::vector<pgs_section> sections,
                                                                long long declared_total_pages = 0,
                                                                pgs_string file_name = "Book.pdf") {
    return std::make_shared<pgs_manifest>(std::move(sections),
                                          pgs_manifest_metadata(declared_total_pages, file_name));
}

// Width of physical page i in generated fixtures, so extracted pages can be
// traced back to their source page
static inline double fixture_page_width(size_t page_index) {
    return 200.0 + (double)page_index;
}

static inline bool write_fixture_pdf(const pgs_string& path, size_t page_count) {
    pgs_pdf_sio pdf;
    for (size_t i = 0; i < page_count; i++) {
        if (!pdf.add_blank_page(fixture_page_width(i), 300.0)) {
            return false;
        }
    }
    return pdf.write(path);
}

static inline const char* sample_manifest_json() {
    return R"({
        "sections": [
            {"title": "Front Cover", "start_page": 1, "end_page": 1, "page_range": "1", "type": "front_matter"},
            {"title": "Chapter 1: The Beginning/End", "start_page": 2, "end_page": 4, "page_range": "2-4", "type": "chapter"},
            {"title": "Notes", "start_page": 5, "end_page": 6, "type": "back_matter"}
        ],
        "metadata": {"total_pages": 6, "file_name": "Sample Book.pdf", "total_sections": 3}
    })";
}

#endif // SPLIT_TEST_FIXTURES_H
