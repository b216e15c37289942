#ifndef USML_DOCUMENT_WRITER_HPP
#define USML_DOCUMENT_WRITER_HPP

#include "parser/document.hpp"
#include <string>

namespace parser::usml {

// Serialize a document back into mapping-language YAML.
// parse_document(write_document(doc)) yields a document equal to doc.
std::string write_document(const Document& doc);

} // namespace parser::usml

#endif // USML_DOCUMENT_WRITER_HPP
