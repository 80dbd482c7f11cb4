#pragma once

#include <string>

#include "error.hpp"
#include "value.hpp"

namespace querygate {

/**
 * Minimal XML mapping between documents and Values.
 *
 * Reading: the children of the root element become an object. An element
 * with child elements becomes a nested object, a leaf becomes its trimmed
 * text, and repeated sibling names collapse into a list. Attributes are
 * ignored. Documents declaring a DOCTYPE or entities are rejected.
 *
 * Writing: the value is emitted under a <response> root; list items are
 * written as <item> elements.
 */
class XmlCodec {
public:
    static Result<Value> parse(const std::string& document);

    static std::string write(const Value& value, const std::string& root_name = "response");

    static std::string escape(const std::string& text);

    // Turns an arbitrary key into a valid element name
    static std::string elementName(const std::string& key);

private:
    static void writeElement(std::string& out, const std::string& name, const Value& value);
};

} // namespace querygate
