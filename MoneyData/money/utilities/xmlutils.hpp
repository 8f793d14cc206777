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

/*! \file money/utilities/xmlutils.hpp
    \brief XML utility functions
    \ingroup utilities
*/

#pragma once

#include <ql/types.hpp>

#include <string>
#include <vector>

// Forward declarations, so the rapidxml headers stay out of the public interface
namespace rapidxml {
template <class Ch> class xml_node;
template <class Ch> class xml_document;
} // namespace rapidxml

namespace money {
namespace data {
using QuantLib::Real;
using QuantLib::Size;
using std::string;
using std::vector;

typedef rapidxml::xml_node<char> XMLNode;

//! Small XML Document wrapper class.
/*! \ingroup utilities
 */
class XMLDocument {
public:
    //! create an empty doc.
    XMLDocument();
    //! load an xml doc from the given file
    XMLDocument(const string& filename);
    //! destructor
    ~XMLDocument();

    //! load a document from a hard-coded string
    void fromXMLString(const string& xmlString);

    //! load a document from a file
    void fromFile(const string& filename);

    XMLNode* getFirstNode(const string& name) const;
    void appendNode(XMLNode*);

    //! save the XML Document to the given file.
    void toFile(const string& filename) const;

    string toString() const;

    rapidxml::xml_document<char>* doc() { return _doc; }
    char* allocString(const string& str);
    XMLNode* allocNode(const string& nodeName);
    XMLNode* allocNode(const string& nodeName, const string& nodeValue);

private:
    XMLDocument(const XMLDocument&) = delete;
    XMLDocument& operator=(const XMLDocument&) = delete;

    rapidxml::xml_document<char>* _doc;
};

//! Base class for all serializable classes
/*! \ingroup utilities
 */
class XMLSerializable {
public:
    virtual ~XMLSerializable() {}
    virtual void fromXML(XMLNode* node) = 0;
    virtual XMLNode* toXML(XMLDocument& doc) const = 0;

    void fromFile(const string& filename);
    void toFile(const string& filename) const;

    //! Parse from XML string
    void fromXMLString(const string& xml);
    //! Parse from XML string
    string toXMLString() const;
};

//! XML Utilities Class
/*! \ingroup utilities
 */
class XMLUtils {
public:
    static void checkNode(XMLNode* n, const string& expectedName);

    static XMLNode* addChild(XMLDocument& doc, XMLNode* n, const string& name);
    static void addChild(XMLDocument& doc, XMLNode* n, const string& name, const string& value);
    static void addChild(XMLDocument& doc, XMLNode* n, const string& name, const char* value);
    static void addChild(XMLDocument& doc, XMLNode* n, const string& name, Real value);
    static void addChild(XMLDocument& doc, XMLNode* n, const string& name, int value);
    static void addChild(XMLDocument& doc, XMLNode* n, const string& name, bool value);

    static void appendNode(XMLNode* parent, XMLNode* child);

    static void addAttribute(XMLDocument& doc, XMLNode* node, const string& attrName, const string& attrValue);

    /*! get a node's first child with the given name, null if there is none */
    static XMLNode* getChildNode(XMLNode* n, const string& name = "");

    /*! get a node's children with the given name, all children if name is empty */
    static vector<XMLNode*> getChildrenNodes(XMLNode* node, const string& name);

    /*! get a node's child value, throws if mandatory and the child is missing */
    static string getChildValue(XMLNode* node, const string& name, bool mandatory = false,
                                const string& defaultValue = string());
    static Real getChildValueAsDouble(XMLNode* node, const string& name, bool mandatory = false,
                                      Real defaultValue = 0.0);
    static int getChildValueAsInt(XMLNode* node, const string& name, bool mandatory = false, int defaultValue = 0);
    static bool getChildValueAsBool(XMLNode* node, const string& name, bool mandatory = false,
                                    bool defaultValue = true);

    /*! remove all children with the given name, returns the number of removed nodes */
    static Size removeChildren(XMLNode* node, const string& name);

    //! Get a node's name
    static string getNodeName(XMLNode* n);
    //! Get a node's value
    static string getNodeValue(XMLNode* node);
    //! Get a node's attribute, empty string if it is not set
    static string getAttribute(XMLNode* node, const string& attrName);

    static XMLNode* getNextSibling(XMLNode* node, const string& name = "");

    //! Write a node out as a string
    static string toString(XMLNode* node);
};

} // namespace data
} // namespace money
