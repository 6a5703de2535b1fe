#pragma once
#include <zip.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

inline bool check(bool ok, const std::string &what) {
    if (!ok) std::cerr << "[TEST] FAIL " << what << "\n";
    return ok;
}

template <typename Actual, typename Expected>
inline bool check_eq(const Actual &actual, const Expected &expected, const std::string &what) {
    if (actual == expected) return true;
    std::cerr << "[TEST] FAIL " << what << "\n  expected: [" << expected << "]\n  actual:   [" << actual << "]\n";
    return false;
}

// Runs `fn` and checks that it throws `Error`; `inspect` then sees the caught exception
template <typename Error, typename Fn, typename Inspect>
inline bool expect_throw(Fn &&fn, Inspect &&inspect, const std::string &what) {
    try {
        fn();
    } catch (const Error &e) {
        return check(inspect(e), what);
    }
    std::cerr << "[TEST] FAIL " << what << ": nothing thrown\n";
    return false;
}

template <typename Error, typename Fn>
inline bool expect_throw(Fn &&fn, const std::string &what) {
    return expect_throw<Error>(std::forward<Fn>(fn), [](const Error &) { return true; }, what);
}

inline int run_test(const char *name, int (*test)()) {
    if (test() != 0) {
        std::cerr << "[TEST] " << name << " failed\n";
        return 1;
    }
    std::cout << "[TEST] OK " << name << std::endl;
    return 0;
}

using PartList = std::vector<std::pair<std::string, std::string>>;

// Writes the parts into a zip through a temporary file and returns the archive bytes
inline std::vector<unsigned char> build_zip(const PartList &parts) {
    char path[] = "/tmp/docintel_testXXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) { std::cerr << "[TEST] mkstemp failed\n"; std::exit(70); }
    close(fd);

    zipFile zf = zipOpen64(path, APPEND_STATUS_CREATE);
    if (!zf) { std::cerr << "[TEST] zipOpen64 failed\n"; std::remove(path); std::exit(71); }
    for (const auto &part : parts) {
        zip_fileinfo info = {};
        if (zipOpenNewFileInZip64(zf, part.first.c_str(), &info, nullptr, 0, nullptr, 0, nullptr,
                                  Z_DEFLATED, Z_DEFAULT_COMPRESSION, 0) != ZIP_OK ||
            zipWriteInFileInZip(zf, part.second.data(), static_cast<unsigned>(part.second.size())) != ZIP_OK ||
            zipCloseFileInZip(zf) != ZIP_OK) {
            std::cerr << "[TEST] writing " << part.first << " failed\n";
            zipClose(zf, nullptr); std::remove(path); std::exit(72);
        }
    }
    zipClose(zf, nullptr);

    std::ifstream in(path, std::ios::binary);
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    std::remove(path);
    return bytes;
}

inline const char *kWordNamespaces =
    "xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\" "
    "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"";

inline std::string document_xml(const std::string &body) {
    return std::string("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n<w:document ") +
           kWordNamespaces + "><w:body>" + body + "</w:body></w:document>";
}

inline std::string rels_xml(const std::string &relationships) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
           "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">" +
           relationships + "</Relationships>";
}

inline std::string hyperlink_rel(const std::string &id, const std::string &target) {
    return "<Relationship Id=\"" + id + "\" "
           "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink\" "
           "Target=\"" + target + "\" TargetMode=\"External\"/>";
}

inline std::string para(const std::string &text, const std::string &style = "") {
    std::string ppr = style.empty() ? "" : "<w:pPr><w:pStyle w:val=\"" + style + "\"/></w:pPr>";
    return "<w:p>" + ppr + "<w:r><w:t xml:space=\"preserve\">" + text + "</w:t></w:r></w:p>";
}

inline std::string list_para(const std::string &text, int num_id, int level) {
    return "<w:p><w:pPr><w:numPr><w:ilvl w:val=\"" + std::to_string(level) + "\"/><w:numId w:val=\"" +
           std::to_string(num_id) + "\"/></w:numPr></w:pPr><w:r><w:t>" + text + "</w:t></w:r></w:p>";
}

inline std::string table(const std::vector<std::vector<std::string>> &rows) {
    std::string xml = "<w:tbl>";
    for (const auto &row : rows) {
        xml += "<w:tr>";
        for (const auto &cell : row) xml += "<w:tc>" + para(cell) + "</w:tc>";
        xml += "</w:tr>";
    }
    return xml + "</w:tbl>";
}

// Minimal package: document part plus any extra parts
inline std::vector<unsigned char> make_docx(const std::string &body, PartList extra = {}) {
    PartList parts;
    parts.emplace_back("[Content_Types].xml",
                       "<?xml version=\"1.0\" encoding=\"UTF-8\"?><Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"/>");
    parts.emplace_back("word/document.xml", document_xml(body));
    for (auto &part : extra) parts.push_back(std::move(part));
    return build_zip(parts);
}
