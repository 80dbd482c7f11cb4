#include "xml_codec.hpp"
#include "string_utils.hpp"

#include <cctype>
#include <crow/logging.h>
#include <expat.h>
#include <memory>
#include <vector>

namespace querygate {

namespace {

struct Frame {
    std::string name;
    std::string text;
    Value children = Value::object();
    bool has_children = false;
};

struct ParseState {
    XML_Parser parser = nullptr;
    std::vector<Frame> stack;
    Value root;
    bool root_closed = false;
    std::string rejection;
};

struct ParserDeleter {
    void operator()(XML_ParserStruct* parser) const { XML_ParserFree(parser); }
};

void addChild(Frame& parent, const std::string& name, Value child) {
    parent.has_children = true;
    Value* existing = parent.children.find(name);
    if (!existing) {
        parent.children.set(name, std::move(child));
        return;
    }
    if (!existing->isList()) {
        Value list = Value::list();
        list.push_back(std::move(*existing));
        *existing = std::move(list);
    }
    existing->push_back(std::move(child));
}

void XMLCALL onStartElement(void* data, const XML_Char* name, const XML_Char** /*attributes*/) {
    auto* state = static_cast<ParseState*>(data);
    Frame frame;
    frame.name = name;
    state->stack.push_back(std::move(frame));
}

void XMLCALL onEndElement(void* data, const XML_Char* /*name*/) {
    auto* state = static_cast<ParseState*>(data);
    Frame frame = std::move(state->stack.back());
    state->stack.pop_back();

    Value value = frame.has_children ? std::move(frame.children) : Value(trimString(frame.text));
    if (state->stack.empty()) {
        state->root = frame.has_children ? std::move(value) : Value::object();
        state->root_closed = true;
        return;
    }
    addChild(state->stack.back(), frame.name, std::move(value));
}

void XMLCALL onCharacterData(void* data, const XML_Char* text, int length) {
    auto* state = static_cast<ParseState*>(data);
    if (!state->stack.empty()) {
        state->stack.back().text.append(text, static_cast<std::size_t>(length));
    }
}

void XMLCALL onDoctype(void* data, const XML_Char* /*name*/, const XML_Char* /*sysid*/,
                       const XML_Char* /*pubid*/, int /*has_internal_subset*/) {
    auto* state = static_cast<ParseState*>(data);
    state->rejection = "DOCTYPE is not allowed";
    XML_StopParser(state->parser, XML_FALSE);
}

void XMLCALL onEntityDecl(void* data, const XML_Char* /*name*/, int /*is_parameter_entity*/,
                          const XML_Char* /*value*/, int /*value_length*/, const XML_Char* /*base*/,
                          const XML_Char* /*system_id*/, const XML_Char* /*public_id*/,
                          const XML_Char* /*notation_name*/) {
    auto* state = static_cast<ParseState*>(data);
    state->rejection = "Entity declarations are not allowed";
    XML_StopParser(state->parser, XML_FALSE);
}

} // namespace

Result<Value> XmlCodec::parse(const std::string& document) {
    std::unique_ptr<XML_ParserStruct, ParserDeleter> parser(XML_ParserCreate("UTF-8"));
    if (!parser) {
        return Error::Internal("Failed to create XML parser");
    }

    ParseState state;
    state.parser = parser.get();
    XML_SetUserData(parser.get(), &state);
    XML_SetElementHandler(parser.get(), onStartElement, onEndElement);
    XML_SetCharacterDataHandler(parser.get(), onCharacterData);
    XML_SetStartDoctypeDeclHandler(parser.get(), onDoctype);
    XML_SetEntityDeclHandler(parser.get(), onEntityDecl);
    XML_SetParamEntityParsing(parser.get(), XML_PARAM_ENTITY_PARSING_NEVER);

    auto status = XML_Parse(parser.get(), document.data(), static_cast<int>(document.size()), XML_TRUE);
    if (status != XML_STATUS_OK || !state.root_closed) {
        std::string reason = !state.rejection.empty()
            ? state.rejection
            : std::string(XML_ErrorString(XML_GetErrorCode(parser.get())));
        CROW_LOG_DEBUG << "XML body rejected at line " << XML_GetCurrentLineNumber(parser.get())
                       << ": " << reason;
        return Error::Parse("Invalid XML format: " + reason, "application/xml");
    }
    return std::move(state.root);
}

std::string XmlCodec::write(const Value& value, const std::string& root_name) {
    std::string out = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>";
    writeElement(out, elementName(root_name), value);
    return out;
}

void XmlCodec::writeElement(std::string& out, const std::string& name, const Value& value) {
    if (value.isNull()) {
        out += "<" + name + "/>";
        return;
    }

    out += "<" + name + ">";
    switch (value.kind()) {
        case Value::Kind::List:
            for (const auto& item : value.asList()) {
                writeElement(out, "item", item);
            }
            break;
        case Value::Kind::Object:
            for (const auto& key : value.keys()) {
                writeElement(out, elementName(key), *value.find(key));
            }
            break;
        default:
            out += escape(value.toString());
            break;
    }
    out += "</" + name + ">";
}

std::string XmlCodec::escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string XmlCodec::elementName(const std::string& key) {
    std::string name;
    for (char c : key) {
        unsigned char uc = static_cast<unsigned char>(c);
        name += (std::isalnum(uc) || c == '_' || c == '-' || c == '.') ? c : '_';
    }
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
        name.insert(name.begin(), '_');
    }
    return name;
}

} // namespace querygate
