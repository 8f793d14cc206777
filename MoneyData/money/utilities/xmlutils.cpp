/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of Money, a free-software/open-source library
 for currencies as units of measure

 Money is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <money/utilities/log.hpp>
#include <money/utilities/parsers.hpp>
#include <money/utilities/xmlutils.hpp>

#include <ql/errors.hpp>

#include <rapidxml.hpp>

// rapidxml_print.hpp calls these before declaring them, which two-phase lookup rejects
namespace rapidxml {
namespace internal {
template <class OutIt, class Ch> inline OutIt print_children(OutIt out, const xml_node<Ch>* node, int flags, int indent);
template <class OutIt, class Ch> inline OutIt print_attributes(OutIt out, const xml_node<Ch>* node, int flags);
template <class OutIt, class Ch> inline OutIt print_data_node(OutIt out, const xml_node<Ch>* node, int flags, int indent);
template <class OutIt, class Ch> inline OutIt print_cdata_node(OutIt out, const xml_node<Ch>* node, int flags, int indent);
template <class OutIt, class Ch>
inline OutIt print_element_node(OutIt out, const xml_node<Ch>* node, int flags, int indent);
template <class OutIt, class Ch>
inline OutIt print_declaration_node(OutIt out, const xml_node<Ch>* node, int flags, int indent);
template <class OutIt, class Ch>
inline OutIt print_comment_node(OutIt out, const xml_node<Ch>* node, int flags, int indent);
template <class OutIt, class Ch>
inline OutIt print_doctype_node(OutIt out, const xml_node<Ch>* node, int flags, int indent);
template <class OutIt, class Ch> inline OutIt print_pi_node(OutIt out, const xml_node<Ch>* node, int flags, int indent);
} // namespace internal
} // namespace rapidxml

#include <rapidxml_print.hpp>

#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>

using namespace std;
using namespace rapidxml;
using QuantLib::Size;

namespace money {
namespace data {

XMLDocument::XMLDocument() : _doc(new rapidxml::xml_document<char>()) {}

XMLDocument::XMLDocument(const string& fileName) : _doc(new rapidxml::xml_document<char>()) { fromFile(fileName); }

XMLDocument::~XMLDocument() { delete _doc; }

void XMLDocument::fromFile(const string& fileName) {
    std::ifstream t(fileName.c_str());
    QL_REQUIRE(t.is_open(), "Failed to open file " << fileName);
    std::stringstream buffer;
    buffer << t.rdbuf();
    try {
        fromXMLString(buffer.str());
    } catch (const std::exception& e) {
        QL_FAIL("Failed to load XML file " << fileName << ": " << e.what());
    }
    DLOG("Loaded XML file " << fileName);
}

void XMLDocument::fromXMLString(const string& xmlString) {
    _doc->clear();
    // the parser works in place, the buffer lives in the document's memory pool
    char* buffer = _doc->allocate_string(xmlString.c_str(), xmlString.size() + 1);
    try {
        _doc->parse<0>(buffer);
    } catch (const rapidxml::parse_error& pe) {
        string where(pe.where<char>());
        QL_FAIL("RapidXML Parse Error : " << pe.what() << ". where=" << where.substr(0, 32));
    }
}

XMLNode* XMLDocument::getFirstNode(const string& name) const {
    return _doc->first_node(name.empty() ? nullptr : name.c_str());
}

void XMLDocument::appendNode(XMLNode* node) { _doc->append_node(node); }

void XMLDocument::toFile(const string& fileName) const {
    std::ofstream ofs(fileName.c_str());
    QL_REQUIRE(ofs.is_open(), "Failed to open file " << fileName << " for writing");
    ofs << toString();
    ofs.close();
}

string XMLDocument::toString() const {
    string s;
    rapidxml::print(std::back_inserter(s), *_doc, 0);
    return s;
}

char* XMLDocument::allocString(const string& str) { return _doc->allocate_string(str.c_str(), str.size() + 1); }

XMLNode* XMLDocument::allocNode(const string& nodeName) {
    XMLNode* n = _doc->allocate_node(node_element, allocString(nodeName));
    QL_REQUIRE(n, "Failed to allocate XMLNode for " << nodeName);
    return n;
}

XMLNode* XMLDocument::allocNode(const string& nodeName, const string& nodeValue) {
    XMLNode* n = _doc->allocate_node(node_element, allocString(nodeName), allocString(nodeValue));
    QL_REQUIRE(n, "Failed to allocate XMLNode for " << nodeName);
    return n;
}

void XMLSerializable::fromFile(const string& filename) {
    XMLDocument doc(filename);
    fromXML(doc.getFirstNode(""));
}

void XMLSerializable::toFile(const string& filename) const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    doc.toFile(filename);
}

void XMLSerializable::fromXMLString(const string& xml) {
    XMLDocument doc;
    doc.fromXMLString(xml);
    fromXML(doc.getFirstNode(""));
}

string XMLSerializable::toXMLString() const {
    XMLDocument doc;
    XMLNode* node = toXML(doc);
    doc.appendNode(node);
    return doc.toString();
}

void XMLUtils::checkNode(XMLNode* node, const string& expectedName) {
    QL_REQUIRE(node, "XML Node is NULL (expected " << expectedName << ")");
    QL_REQUIRE(getNodeName(node) == expectedName,
               "XML Node name " << getNodeName(node) << " does not match expected name " << expectedName);
}

XMLNode* XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XML Node is NULL (adding " << name << ")");
    XMLNode* node = doc.allocNode(name);
    n->append_node(node);
    return node;
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, const char* value) {
    addChild(doc, n, name, string(value));
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, const string& value) {
    QL_REQUIRE(n, "XML Node is NULL (adding " << name << ")");
    if (value.size() == 0) {
        addChild(doc, n, name);
    } else {
        XMLNode* node = doc.allocNode(name, value);
        n->append_node(node);
    }
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, Real value) {
    // shortest of 15 or 17 significant digits that reads back to the same value
    ostringstream oss;
    oss << std::setprecision(std::numeric_limits<Real>::digits10) << value;
    Real check;
    if (!tryParseReal(oss.str(), check) || check != value) {
        oss.str(string());
        oss << std::setprecision(std::numeric_limits<Real>::max_digits10) << value;
    }
    addChild(doc, n, name, oss.str());
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, int value) {
    addChild(doc, n, name, std::to_string(value));
}

void XMLUtils::addChild(XMLDocument& doc, XMLNode* n, const string& name, bool value) {
    string s = value ? "true" : "false";
    addChild(doc, n, name, s);
}

void XMLUtils::appendNode(XMLNode* parent, XMLNode* child) {
    QL_REQUIRE(parent, "XML Parent Node is NULL");
    QL_REQUIRE(child, "XML Child Node is NULL");
    parent->append_node(child);
}

void XMLUtils::addAttribute(XMLDocument& doc, XMLNode* node, const string& attrName, const string& attrValue) {
    QL_REQUIRE(node, "XML Node is NULL (adding attribute " << attrName << ")");
    node->append_attribute(doc.doc()->allocate_attribute(doc.allocString(attrName), doc.allocString(attrValue)));
}

XMLNode* XMLUtils::getChildNode(XMLNode* n, const string& name) {
    QL_REQUIRE(n, "XMLUtils::getChildNode(" << name << "): XML Node is NULL");
    return n->first_node(name.empty() ? nullptr : name.c_str());
}

vector<XMLNode*> XMLUtils::getChildrenNodes(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::getChildrenNodes(" << name << "): XML Node is NULL");
    vector<XMLNode*> res;
    const char* p = name.empty() ? nullptr : name.c_str();
    for (XMLNode* c = node->first_node(p); c; c = c->next_sibling(p)) {
        if (c->type() == node_element)
            res.push_back(c);
    }
    return res;
}

string XMLUtils::getChildValue(XMLNode* node, const string& name, bool mandatory, const string& defaultValue) {
    QL_REQUIRE(node, "XMLUtils::getChildValue(" << name << "): XML Node is NULL");
    XMLNode* child = node->first_node(name.c_str());
    QL_REQUIRE(!mandatory || child, "Error: mandatory child node " << name << " not found in " << getNodeName(node));
    return child ? getNodeValue(child) : defaultValue;
}

Real XMLUtils::getChildValueAsDouble(XMLNode* node, const string& name, bool mandatory, Real defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseReal(s);
}

int XMLUtils::getChildValueAsInt(XMLNode* node, const string& name, bool mandatory, int defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseInteger(s);
}

bool XMLUtils::getChildValueAsBool(XMLNode* node, const string& name, bool mandatory, bool defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseBool(s);
}

Size XMLUtils::removeChildren(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::removeChildren(" << name << "): XML Node is NULL");
    Size removed = 0;
    XMLNode* child = node->first_node(name.c_str());
    while (child) {
        XMLNode* next = child->next_sibling(name.c_str());
        node->remove_node(child);
        ++removed;
        child = next;
    }
    return removed;
}

string XMLUtils::getNodeName(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeName(): XML Node is NULL");
    return string(node->name(), node->name_size());
}

string XMLUtils::getNodeValue(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::getNodeValue(): XML Node is NULL");
    return string(node->value(), node->value_size());
}

string XMLUtils::getAttribute(XMLNode* node, const string& attrName) {
    QL_REQUIRE(node, "XMLUtils::getAttribute(" << attrName << "): XML Node is NULL");
    xml_attribute<char>* attr = node->first_attribute(attrName.c_str());
    return attr ? string(attr->value(), attr->value_size()) : string();
}

XMLNode* XMLUtils::getNextSibling(XMLNode* node, const string& name) {
    QL_REQUIRE(node, "XMLUtils::getNextSibling(" << name << "): XML Node is NULL");
    return node->next_sibling(name.empty() ? nullptr : name.c_str());
}

string XMLUtils::toString(XMLNode* node) {
    QL_REQUIRE(node, "XMLUtils::toString(): XML Node is NULL");
    string s;
    rapidxml::print(std::back_inserter(s), *node, 0);
    return s;
}

} // namespace data
} // namespace money
