#include "model/CitationDocumentReader.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <boost/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

namespace citerate {

namespace json = boost::json;

namespace {

const std::string LOG_SOURCE = "CitationDocumentReader";

// Absent and explicit null are the same for optional members.
const json::value* optionalMember(const json::object& obj, const char* name) {
    const json::value* member = obj.if_contains(name);
    if (member == nullptr || member->is_null()) {
        return nullptr;
    }
    return member;
}

long countFrom(const json::value& value) {
    constexpr long max_count = std::numeric_limits<long>::max();
    if (value.is_int64() && value.get_int64() >= 0) {
        return static_cast<long>(value.get_int64());
    }
    if (value.is_uint64() && value.get_uint64() <= static_cast<std::uint64_t>(max_count)) {
        return static_cast<long>(value.get_uint64());
    }
    if (value.is_double()) {
        const double d = value.get_double();
        if (std::isfinite(d) && d >= 0.0 && d == std::floor(d) && d <= static_cast<double>(max_count)) {
            return static_cast<long>(d);
        }
    }
    THROW_DATA_FORMAT("CitationDocumentReader::read",
                      "Citation count must be a non-negative integer, got " + json::serialize(value));
}

PaperRecord readPaper(const json::value& node, size_t index) {
    const std::string where = "paper " + std::to_string(index);
    if (!node.is_object()) {
        THROW_DATA_FORMAT("CitationDocumentReader::read", where + " is not a JSON object");
    }
    const json::object& obj = node.get_object();

    PaperRecord paper;
    const json::value* title = obj.if_contains("title");
    if (title == nullptr || !title->is_string()) {
        THROW_DATA_FORMAT("CitationDocumentReader::read", where + " has no title string");
    }
    paper.title = std::string(title->get_string());

    try {
        if (const json::value* total = optionalMember(obj, "total_citations")) {
            paper.total_citations = countFrom(*total);
        }

        if (const json::value* citations = optionalMember(obj, "citations_by_year")) {
            if (!citations->is_object()) {
                THROW_DATA_FORMAT("CitationDocumentReader::read", "citations_by_year is not an object");
            }
            for (const auto& entry : citations->get_object()) {
                const int year = CitationDocumentReader::parseYearKey(std::string(entry.key()));
                paper.citations_by_year[year] = countFrom(entry.value());
            }
        }
    } catch (const DataFormatException& e) {
        THROW_DATA_FORMAT("CitationDocumentReader::read",
                          where + " ('" + paper.title + "'): " + e.getMessage());
    }
    return paper;
}

} // namespace

int CitationDocumentReader::parseYearKey(const std::string& key) {
    if (key.size() != 4) {
        THROW_DATA_FORMAT("CitationDocumentReader::parseYearKey", "Malformed year key '" + key + "'");
    }
    for (char c : key) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            THROW_DATA_FORMAT("CitationDocumentReader::parseYearKey", "Malformed year key '" + key + "'");
        }
    }
    return std::atoi(key.c_str());
}

CitationDocument CitationDocumentReader::read(std::istream& input, const std::string& source_name) {
    const std::string text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};

    json::error_code ec;
    const json::value root = json::parse(text, ec);
    if (ec) {
        THROW_DATA_FORMAT("CitationDocumentReader::read",
                          "Malformed JSON in " + source_name + ": " + ec.message());
    }
    if (!root.is_object()) {
        THROW_DATA_FORMAT("CitationDocumentReader::read", source_name + " is not a JSON object");
    }
    const json::object& obj = root.get_object();

    std::optional<std::string> user_id;
    if (const json::value* id = optionalMember(obj, "user_id")) {
        if (!id->is_string()) {
            THROW_DATA_FORMAT("CitationDocumentReader::read", source_name + ": user_id is not a string");
        }
        user_id = std::string(id->get_string());
    }

    const json::value* scraped_at = obj.if_contains("scraped_at");
    if (scraped_at == nullptr || !scraped_at->is_string()) {
        THROW_DATA_FORMAT("CitationDocumentReader::read", source_name + " has no scraped_at timestamp");
    }
    const std::string scraped_at_text(scraped_at->get_string());
    const CaptureTimestamp captured_at = CaptureTimestamp::parse(scraped_at_text);

    std::vector<PaperRecord> papers;
    if (const json::value* papers_node = optionalMember(obj, "papers")) {
        if (!papers_node->is_array()) {
            THROW_DATA_FORMAT("CitationDocumentReader::read", source_name + ": papers is not an array");
        }
        const json::array& entries = papers_node->get_array();
        papers.reserve(entries.size());
        for (size_t index = 0; index < entries.size(); ++index) {
            papers.push_back(readPaper(entries[index], index));
        }
    }

    Logger::getInstance().info(LOG_SOURCE, "Loaded " + std::to_string(papers.size()) +
                                           " papers from " + source_name);
    return CitationDocument(user_id, scraped_at_text, captured_at, std::move(papers));
}

CitationDocument CitationDocumentReader::readFile(const std::string& filepath) {
    std::ifstream input(filepath);
    if (!input.is_open()) {
        throw FileIOException("CitationDocumentReader::readFile", "Cannot open " + filepath);
    }
    return read(input, filepath);
}

} // namespace citerate
