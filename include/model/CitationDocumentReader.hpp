#ifndef CITATION_DOCUMENT_READER_HPP
#define CITATION_DOCUMENT_READER_HPP

#include "model/AnalysisTypes.hpp"
#include <istream>
#include <string>

namespace citerate {

/**
 * @brief Reads a citation snapshot from JSON:
 *
 *     {
 *       "user_id": "...",
 *       "scraped_at": "2022-06-15T12:00:00Z",
 *       "papers": [
 *         {"title": "...", "total_citations": 8, "citations_by_year": {"2020": 3, "2021": 5}}
 *       ]
 *     }
 *
 * A paper with an empty, null or missing citations_by_year is valid, as is
 * a null or missing user_id or total_citations. Titles and user ids must be
 * JSON strings; counts must be JSON numbers.
 */
class CitationDocumentReader {
public:
    /**
     * @throws FileIOException if the file cannot be opened.
     * @throws DataFormatException on malformed JSON, a missing or unparsable
     *         scraped_at, a paper whose title is missing or not a string, a
     *         year key that is not four decimal digits, or a count that is not
     *         a non-negative integral number (3 and 3.0 are accepted).
     */
    static CitationDocument readFile(const std::string& filepath);

    static CitationDocument read(std::istream& input, const std::string& source_name = "<stream>");

    /**
     * @brief Parse a year key; must be exactly four decimal digits.
     * @throws DataFormatException otherwise.
     */
    static int parseYearKey(const std::string& key);
};

} // namespace citerate

#endif // CITATION_DOCUMENT_READER_HPP
