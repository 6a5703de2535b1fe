#include "test_common.h"
#include "docintel/retrieval/parse_docx.hpp"

using namespace docintel::retrieval;

static int test_elements_preserve_order() {
    std::string body = para("first") + table({{"a"}}) + para("second") + table({{"b"}}) + para("third");
    Document document = DOCXParser::parse_document(make_docx(body));

    std::vector<DocumentElement> expected = {DocumentElement::paragraph(0), DocumentElement::table(0),
                                             DocumentElement::paragraph(1), DocumentElement::table(1),
                                             DocumentElement::paragraph(2)};
    if (!check(document.elements == expected, "element interleaving")) return 1;
    if (!check_eq(document.paragraphs.size(), static_cast<size_t>(3), "cell paragraphs stay in cells")) return 1;
    if (!check_eq(document.paragraphs[1].to_text(), std::string("second"), "second top-level paragraph")) return 1;
    if (!check_eq(document.tables[1].rows[0].cells[0].paragraphs[0].to_text(), std::string("b"), "cell text")) return 1;
    return 0;
}

static int test_formatting_toggles() {
    std::string body =
        "<w:p>"
        "<w:r><w:rPr><w:b/></w:rPr><w:t>bold</w:t></w:r>"
        "<w:r><w:rPr><w:b w:val=\"false\"/><w:i w:val=\"1\"/></w:rPr><w:t>italic</w:t></w:r>"
        "<w:r><w:rPr><w:u w:val=\"none\"/><w:strike w:val=\"0\"/></w:rPr><w:t>plain</w:t></w:r>"
        "<w:r><w:rPr><w:dstrike/><w:u w:val=\"single\"/></w:rPr><w:t>struck</w:t></w:r>"
        "<w:r><w:rPr><w:b w:val=\"off\"/></w:rPr><w:t>offIsNotAFalseValue</w:t></w:r>"
        "</w:p>";
    Document document = DOCXParser::parse_document(make_docx(body));
    const auto &runs = document.paragraphs.at(0).runs;

    if (!check_eq(runs.size(), static_cast<size_t>(5), "run count")) return 1;
    if (!check(runs[0].bold && !runs[0].italic, "bare w:b enables bold")) return 1;
    if (!check(!runs[1].bold && runs[1].italic, "false disables, 1 enables")) return 1;
    if (!check(!runs[2].underline && !runs[2].strikethrough, "none and 0 disable")) return 1;
    if (!check(runs[3].strikethrough && runs[3].underline, "dstrike is strikethrough, single underline")) return 1;
    if (!check(runs[4].bold, "only exact false/0/none disable")) return 1;
    if (!check(!runs[0].underline && !runs[1].underline, "formatting is not inherited between runs")) return 1;
    return 0;
}

static int test_hyperlinks() {
    std::string body =
        "<w:p><w:r><w:t xml:space=\"preserve\">See </w:t></w:r>"
        "<w:hyperlink r:id=\"rId5\"><w:r><w:rPr><w:b/><w:i/></w:rPr><w:t>text</w:t></w:r></w:hyperlink>"
        "<w:r><w:t xml:space=\"preserve\"> and </w:t></w:r>"
        "<w:hyperlink w:anchor=\"intro\"><w:r><w:t>intro</w:t></w:r></w:hyperlink>"
        "<w:hyperlink r:id=\"rId404\"><w:r><w:t>dangling</w:t></w:r></w:hyperlink>"
        "</w:p>";
    auto bytes = make_docx(body, {{"word/_rels/document.xml.rels", rels_xml(hyperlink_rel("rId5", "https://example.com/u"))}});
    Document document = DOCXParser::parse_document(bytes);
    const auto &runs = document.paragraphs.at(0).runs;

    if (!check(!runs[0].hyperlink_url.has_value(), "run before link has no url")) return 1;
    if (!check(runs[1].hyperlink_url && *runs[1].hyperlink_url == "https://example.com/u", "resolved url")) return 1;
    if (!check(!runs[2].hyperlink_url.has_value(), "context pops at hyperlink end")) return 1;
    if (!check(runs[3].hyperlink_url && *runs[3].hyperlink_url == "#intro", "anchor link")) return 1;
    if (!check(!runs[4].hyperlink_url.has_value(), "unknown relationship leaves run unlinked")) return 1;
    if (!check_eq(document.to_markdown(), std::string("See [***text***](https://example.com/u) and [intro](#intro)dangling"), "link markdown")) return 1;
    return 0;
}

static int test_tabs_breaks_and_spacing() {
    std::string body =
        "<w:p><w:r><w:t>a</w:t><w:tab/><w:t>b</w:t><w:br/><w:t>c</w:t></w:r></w:p>"
        "<w:p><w:r><w:t>Hello</w:t></w:r><w:r><w:t>world</w:t></w:r>"
        "<w:r><w:t xml:space=\"preserve\"> again</w:t></w:r></w:p>";
    Document document = DOCXParser::parse_document(make_docx(body));

    if (!check_eq(document.paragraphs[0].to_text(), std::string("a\tb\nc"), "tab and break")) return 1;
    if (!check_eq(document.paragraphs[1].to_text(), std::string("Hello world again"), "single spaces between runs")) return 1;
    return 0;
}

static int test_nested_tables_and_text_boxes() {
    std::string inner = table({{"inner"}});
    std::string body =
        "<w:tbl><w:tr><w:tc>" + para("outer") + inner + "</w:tc><w:tc>" + para("right") + "</w:tc></w:tr></w:tbl>" +
        "<w:p><w:r><w:t>kept</w:t></w:r><w:r><w:pict><w:txbxContent>" + para("boxed") +
        "</w:txbxContent></w:pict></w:r></w:p>";
    Document document = DOCXParser::parse_document(make_docx(body));

    if (!check_eq(document.tables.size(), static_cast<size_t>(1), "nested table flattened")) return 1;
    const auto &cell = document.tables[0].rows[0].cells[0];
    if (!check_eq(cell.paragraphs.size(), static_cast<size_t>(2), "nested paragraphs land in the outer cell")) return 1;
    if (!check_eq(cell.paragraphs[1].to_text(), std::string("inner"), "nested cell text")) return 1;
    if (!check_eq(document.tables[0].rows[0].cells.size(), static_cast<size_t>(2), "outer row keeps its cells")) return 1;
    if (!check_eq(document.paragraphs.size(), static_cast<size_t>(1), "text box paragraphs skipped")) return 1;
    if (!check_eq(document.paragraphs[0].to_text(), std::string("kept"), "paragraph around text box")) return 1;
    return 0;
}

static int test_notes() {
    std::string footnotes = std::string("<w:footnotes ") + kWordNamespaces + ">"
        "<w:footnote w:type=\"separator\" w:id=\"-1\"><w:p><w:r><w:separator/></w:r></w:p></w:footnote>"
        "<w:footnote w:type=\"continuationSeparator\" w:id=\"0\"><w:p><w:r><w:continuationSeparator/></w:r></w:p></w:footnote>"
        "<w:footnote w:id=\"1\">" + para("First note.") + para("More.") + "</w:footnote>"
        "</w:footnotes>";
    std::string endnotes = std::string("<w:endnotes ") + kWordNamespaces + ">"
        "<w:endnote w:id=\"0\">" + para("placeholder") + "</w:endnote>"
        "<w:endnote w:id=\"2\">" + para("End note") + "</w:endnote>"
        "</w:endnotes>";
    auto bytes = make_docx(para("Body"), {{"word/footnotes.xml", footnotes}, {"word/endnotes.xml", endnotes}});
    Document document = DOCXParser::parse_document(bytes);

    if (!check_eq(document.footnotes.size(), static_cast<size_t>(1), "separators dropped")) return 1;
    if (!check_eq(document.footnotes[0].id, std::string("1"), "footnote id")) return 1;
    if (!check(document.footnotes[0].note_type == NoteType::Footnote, "footnote type")) return 1;
    if (!check_eq(document.endnotes.size(), static_cast<size_t>(1), "placeholder endnote dropped")) return 1;
    if (!check(document.endnotes[0].note_type == NoteType::Endnote, "endnote type")) return 1;
    if (!check(document.elements.size() == 1, "notes never enter elements")) return 1;
    if (!check_eq(document.to_markdown(), std::string("Body\n\n[^1]: First note. More.\n[^2]: End note"), "notes appended")) return 1;
    return 0;
}

static int test_headers_and_footers() {
    std::string rels = rels_xml(
        "<Relationship Id=\"rId8\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/header\" Target=\"header2.xml\"/>"
        "<Relationship Id=\"rId9\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/footer\" Target=\"/word/footer1.xml\"/>");
    std::string body = para("Body") +
                       "<w:sectPr><w:headerReference w:type=\"first\" r:id=\"rId8\"/>"
                       "<w:footerReference w:type=\"default\" r:id=\"rId9\"/></w:sectPr>";
    std::string header = std::string("<w:hdr ") + kWordNamespaces + ">" + para("Header text") + "</w:hdr>";
    std::string footer = std::string("<w:ftr ") + kWordNamespaces + ">" + table({{"Page", "1"}}) + "</w:ftr>";

    auto bytes = make_docx(body, {{"word/_rels/document.xml.rels", rels},
                                  {"word/header2.xml", header},
                                  {"word/footer1.xml", footer}});
    Document document = DOCXParser::parse_document(bytes);

    if (!check_eq(document.headers.size(), static_cast<size_t>(1), "one header")) return 1;
    if (!check(document.headers[0].header_type == HeaderFooterType::First, "header type from reference")) return 1;
    if (!check_eq(document.headers[0].extract_text(), std::string("Header text\n"), "header text")) return 1;
    if (!check_eq(document.footers.size(), static_cast<size_t>(1), "one footer")) return 1;
    if (!check_eq(document.footers[0].tables.size(), static_cast<size_t>(1), "footer table")) return 1;
    if (!check_eq(document.to_markdown(), std::string("Body"), "headers and footers are not rendered")) return 1;
    return 0;
}

static int test_unreferenced_header_parts_are_probed() {
    std::string header = std::string("<w:hdr ") + kWordNamespaces + ">" + para("Probe") + "</w:hdr>";
    Document document = DOCXParser::parse_document(make_docx(para("Body"), {{"word/header1.xml", header}}));
    if (!check_eq(document.headers.size(), static_cast<size_t>(1), "probed header")) return 1;
    if (!check(document.headers[0].header_type == HeaderFooterType::Default, "probed header is default")) return 1;
    if (!check(document.footers.empty(), "no footers")) return 1;
    return 0;
}

static int test_core_properties() {
    std::string core =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<cp:coreProperties xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\" "
        "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" xmlns:dcterms=\"http://purl.org/dc/terms/\">"
        "<dc:title>Quarterly Report</dc:title><dc:creator>Jordan</dc:creator>"
        "<cp:revision>4</cp:revision><dcterms:created>2024-01-02T03:04:05Z</dcterms:created>"
        "</cp:coreProperties>";
    Document document = DOCXParser::parse_document(make_docx(para("x"), {{"docProps/core.xml", core}}));

    if (!check(document.properties.title && *document.properties.title == "Quarterly Report", "title")) return 1;
    if (!check(document.properties.creator && *document.properties.creator == "Jordan", "creator")) return 1;
    if (!check(document.properties.revision && *document.properties.revision == "4", "revision")) return 1;
    if (!check(document.properties.created && *document.properties.created == "2024-01-02T03:04:05Z", "created")) return 1;
    if (!check(!document.properties.subject.has_value(), "absent subject")) return 1;
    if (!check(!document.properties.empty(), "properties present")) return 1;
    return 0;
}

static int test_optional_parts_absent() {
    Document document = DOCXParser::parse_document(make_docx(para("only")));
    if (!check(document.numbering_defs.empty(), "no numbering")) return 1;
    if (!check(document.headers.empty() && document.footers.empty(), "no headers/footers")) return 1;
    if (!check(document.footnotes.empty() && document.endnotes.empty(), "no notes")) return 1;
    if (!check(document.properties.empty(), "no properties")) return 1;
    if (!check_eq(document.extract_text(), std::string("only\n"), "plain text")) return 1;
    return 0;
}

static int test_malformed_xml() {
    auto bytes = build_zip({{"word/document.xml", "<w:document><w:body><w:p></w:body>"}});
    if (!expect_throw<DocxParseError>([&] { DOCXParser::parse_document(bytes); },
            [](const DocxParseError &e) { return e.kind() == DocxParseError::Kind::Xml; },
            "kind Xml")) return 1;

    auto bad_numbering = make_docx(para("x"), {{"word/numbering.xml", "<w:numbering"}});
    if (!expect_throw<DocxParseError>([&] { DOCXParser::parse_document(bad_numbering); },
            [](const DocxParseError &e) { return e.kind() == DocxParseError::Kind::Xml; },
            "malformed optional part still fails")) return 1;
    return 0;
}

static int test_extract_text_flattening() {
    std::string body = para("Title", "Title") + table({{"A", "B"}, {"C", "D"}}) + para("End");
    Document document = DOCXParser::parse_document(make_docx(body));
    if (!check_eq(document.extract_text(), std::string("Title\nA\tB\t\nC\tD\t\n\nEnd\n"), "element order text")) return 1;
    auto cells = document.tables[0].to_cells();
    if (!check(cells.size() == 2 && cells[1][0] == "C", "cell grid")) return 1;
    return 0;
}

int main() {
    if (run_test("test_elements_preserve_order", test_elements_preserve_order) != 0) return 1;
    if (run_test("test_formatting_toggles", test_formatting_toggles) != 0) return 1;
    if (run_test("test_hyperlinks", test_hyperlinks) != 0) return 1;
    if (run_test("test_tabs_breaks_and_spacing", test_tabs_breaks_and_spacing) != 0) return 1;
    if (run_test("test_nested_tables_and_text_boxes", test_nested_tables_and_text_boxes) != 0) return 1;
    if (run_test("test_notes", test_notes) != 0) return 1;
    if (run_test("test_headers_and_footers", test_headers_and_footers) != 0) return 1;
    if (run_test("test_unreferenced_header_parts_are_probed", test_unreferenced_header_parts_are_probed) != 0) return 1;
    if (run_test("test_core_properties", test_core_properties) != 0) return 1;
    if (run_test("test_optional_parts_absent", test_optional_parts_absent) != 0) return 1;
    if (run_test("test_malformed_xml", test_malformed_xml) != 0) return 1;
    if (run_test("test_extract_text_flattening", test_extract_text_flattening) != 0) return 1;
    std::cout << "[TEST] OK document parser" << std::endl;
    return 0;
}
