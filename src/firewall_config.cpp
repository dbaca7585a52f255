#include "firewall_config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <uuid/uuid.h>
#include <climits>

namespace macfence {

namespace {

const char* const kComponent = "FirewallConfig";

const xmlChar* xc(const char* s) {
    return reinterpret_cast<const xmlChar*>(s);
}

struct XmlCharGuard {
    xmlChar* ptr = nullptr;
    ~XmlCharGuard() {
        if (ptr != nullptr) {
            xmlFree(ptr);
        }
    }
};

std::string trimRight(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
        value.pop_back();
    }
    return value;
}

xmlNodePtr findChild(xmlNodePtr parent, const char* name) {
    if (parent == nullptr) {
        return nullptr;
    }
    for (xmlNodePtr child = parent->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && xmlStrEqual(child->name, xc(name))) {
            return child;
        }
    }
    return nullptr;
}

xmlNodePtr ensureChild(xmlNodePtr parent, const char* name, bool* created = nullptr) {
    xmlNodePtr child = findChild(parent, name);
    if (created != nullptr) {
        *created = child == nullptr;
    }
    if (child == nullptr) {
        child = xmlNewChild(parent, nullptr, xc(name), nullptr);
    }
    return child;
}

void addTextChild(xmlNodePtr parent, const char* name, const std::string& text) {
    xmlNewTextChild(parent, nullptr, xc(name), xc(text.c_str()));
}

void removeAllChildren(xmlNodePtr node) {
    xmlNodePtr child = node->children;
    while (child != nullptr) {
        xmlNodePtr next = child->next;
        xmlUnlinkNode(child);
        xmlFreeNode(child);
        child = next;
    }
}

std::string newUuid() {
    uuid_t raw;
    uuid_generate_random(raw);
    char text[37];
    uuid_unparse_lower(raw, text);
    return text;
}

bool ownedByMarker(const std::string& description, const std::string& marker) {
    if (description == marker) {
        return true;
    }
    const std::string prefix = marker + kRuleMarkerSeparator;
    return description.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

FirewallConfigDocument::FirewallConfigDocument(DocPtr doc)
    : doc_(std::move(doc)) {
}

FirewallConfigDocument FirewallConfigDocument::parse(const std::string& bytes) {
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        throw MalformedDocumentError("Configuration document too large");
    }

    xmlInitParser();
    xmlResetLastError();

    DocPtr doc(xmlReadMemory(bytes.data(), static_cast<int>(bytes.size()), "config.xml", nullptr,
                             XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
               &xmlFreeDoc);
    if (!doc) {
        std::string reason = "not well-formed";
        const xmlError* error = xmlGetLastError();
        if (error != nullptr && error->message != nullptr) {
            reason = trimRight(error->message) + " (line " + std::to_string(error->line) + ")";
        }
        throw MalformedDocumentError("Failed to parse firewall configuration: " + reason);
    }
    if (xmlDocGetRootElement(doc.get()) == nullptr) {
        throw MalformedDocumentError("Failed to parse firewall configuration: no root element");
    }

    return FirewallConfigDocument(std::move(doc));
}

std::string FirewallConfigDocument::serialize() const {
    XmlCharGuard buffer;
    int size = 0;
    xmlDocDumpMemoryEnc(doc_.get(), &buffer.ptr, &size, "UTF-8");
    if (buffer.ptr == nullptr || size < 0) {
        throw MalformedDocumentError("Failed to serialize firewall configuration");
    }
    return std::string(reinterpret_cast<const char*>(buffer.ptr), static_cast<size_t>(size));
}

FirewallConfigDocument::Node FirewallConfigDocument::root() const {
    return xmlDocGetRootElement(doc_.get());
}

FirewallConfigDocument::Node FirewallConfigDocument::findAlias(const std::string& name) const {
    xmlNodePtr aliases = findChild(findChild(findChild(findChild(root(), "OPNsense"), "Firewall"),
                                             "Alias"),
                                   "aliases");
    if (aliases == nullptr) {
        return nullptr;
    }
    for (xmlNodePtr alias = aliases->children; alias != nullptr; alias = alias->next) {
        if (alias->type != XML_ELEMENT_NODE || !xmlStrEqual(alias->name, xc("alias"))) {
            continue;
        }
        std::optional<std::string> alias_name = childText(alias, "name");
        if (alias_name && *alias_name == name) {
            return alias;
        }
    }
    return nullptr;
}

void FirewallConfigDocument::upsertAlias(const std::string& name,
                                         const std::vector<std::string>& mac_list,
                                         const std::string& description) {
    xmlNodePtr alias = findAlias(name);

    if (alias == nullptr) {
        xmlNodePtr opnsense = ensureChild(root(), "OPNsense");
        xmlNodePtr firewall = ensureChild(opnsense, "Firewall");
        bool section_created = false;
        xmlNodePtr alias_section = ensureChild(firewall, "Alias", &section_created);
        if (section_created) {
            addTextChild(alias_section, "version", "1.0.1");
        }
        xmlNodePtr aliases = ensureChild(alias_section, "aliases");

        alias = xmlNewChild(aliases, nullptr, xc("alias"), nullptr);
        xmlNewProp(alias, xc("uuid"), xc(newUuid().c_str()));
        Logger::debug(kComponent, "Creating alias " + name);
    } else {
        removeAllChildren(alias);
        Logger::debug(kComponent, "Rewriting alias " + name);
    }

    std::string content;
    for (size_t i = 0; i < mac_list.size(); ++i) {
        if (i > 0) {
            content += '\n';
        }
        content += mac_list[i];
    }

    addTextChild(alias, "enabled", "1");
    addTextChild(alias, "name", name);
    addTextChild(alias, "type", "mac");
    addTextChild(alias, "path_expression", "");
    addTextChild(alias, "proto", "");
    addTextChild(alias, "interface", "");
    addTextChild(alias, "counters", "0");
    addTextChild(alias, "updatefreq", "");
    addTextChild(alias, "content", content);
    addTextChild(alias, "description", description);
}

FirewallConfigDocument::Node FirewallConfigDocument::filterSection() const {
    return findChild(root(), "filter");
}

std::vector<FirewallConfigDocument::Node> FirewallConfigDocument::rules() const {
    std::vector<Node> result;
    xmlNodePtr filter = filterSection();
    if (filter == nullptr) {
        return result;
    }
    for (xmlNodePtr rule = filter->children; rule != nullptr; rule = rule->next) {
        if (rule->type == XML_ELEMENT_NODE && xmlStrEqual(rule->name, xc("rule"))) {
            result.push_back(rule);
        }
    }
    return result;
}

FirewallConfigDocument::Node
FirewallConfigDocument::findRuleByDescriptionSubstring(const std::string& marker) const {
    for (Node rule : rules()) {
        std::optional<std::string> descr = childText(rule, "descr");
        if (descr && descr->find(marker) != std::string::npos) {
            return rule;
        }
    }
    return nullptr;
}

FirewallConfigDocument::Node FirewallConfigDocument::findRuleByMarker(const std::string& marker,
                                                                      bool legacy_substring_match) const {
    for (Node rule : rules()) {
        std::optional<std::string> descr = childText(rule, "descr");
        if (descr && ownedByMarker(*descr, marker)) {
            return rule;
        }
    }

    if (!legacy_substring_match) {
        return nullptr;
    }

    Node legacy = findRuleByDescriptionSubstring(marker);
    if (legacy != nullptr) {
        Logger::warning(kComponent, "Rule matched by description substring '" + marker +
                                    "': " + childText(legacy, "descr").value_or(""));
    }
    return legacy;
}

void FirewallConfigDocument::upsertBlockRule(const std::string& alias_name,
                                             const std::string& marker,
                                             bool enabled,
                                             const std::string& interface,
                                             bool legacy_substring_match) {
    Node rule = findRuleByMarker(marker, legacy_substring_match);

    if (rule == nullptr) {
        xmlNodePtr filter = ensureChild(root(), "filter");
        rule = xmlNewChild(filter, nullptr, xc("rule"), nullptr);
        xmlNewProp(rule, xc("uuid"), xc(newUuid().c_str()));
        Logger::debug(kComponent, "Creating block rule " + marker);
    } else {
        removeAllChildren(rule);
        Logger::debug(kComponent, "Rewriting block rule " + marker);
    }

    addTextChild(rule, "type", "block");
    addTextChild(rule, "interface", interface);
    addTextChild(rule, "ipprotocol", "inet46");
    addTextChild(rule, "statetype", "keep state");
    addTextChild(rule, "direction", "in");
    addTextChild(rule, "quick", "1");
    addTextChild(rule, "disabled", enabled ? "0" : "1");

    xmlNodePtr source = xmlNewChild(rule, nullptr, xc("source"), nullptr);
    addTextChild(source, "address", alias_name);

    xmlNodePtr destination = xmlNewChild(rule, nullptr, xc("destination"), nullptr);
    addTextChild(destination, "any", "1");

    addTextChild(rule, "descr", ruleDescription(marker, alias_name));
}

bool FirewallConfigDocument::setRuleEnabled(const std::string& marker, bool enabled,
                                            bool legacy_substring_match) {
    Node rule = findRuleByMarker(marker, legacy_substring_match);
    if (rule == nullptr) {
        return false;
    }

    xmlNodePtr disabled = ensureChild(rule, "disabled");
    xmlNodeSetContent(disabled, xc(enabled ? "0" : "1"));
    return true;
}

bool FirewallConfigDocument::isRuleEnabled(Node rule) {
    std::optional<std::string> disabled = childText(rule, "disabled");
    return !disabled || *disabled != "1";
}

std::optional<std::string> FirewallConfigDocument::childText(Node parent, const std::string& child_name) {
    xmlNodePtr child = findChild(parent, child_name.c_str());
    if (child == nullptr) {
        return std::nullopt;
    }
    XmlCharGuard content;
    content.ptr = xmlNodeGetContent(child);
    if (content.ptr == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(content.ptr));
}

std::string FirewallConfigDocument::nodeToString(Node node) const {
    if (node == nullptr) {
        return "";
    }
    std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)> buffer(xmlBufferCreate(), &xmlBufferFree);
    if (!buffer) {
        throw MalformedDocumentError("Failed to allocate serialization buffer");
    }
    if (xmlNodeDump(buffer.get(), doc_.get(), node, 0, 0) < 0) {
        throw MalformedDocumentError("Failed to serialize configuration node");
    }
    return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())),
                       static_cast<size_t>(xmlBufferLength(buffer.get())));
}

std::string FirewallConfigDocument::ruleDescription(const std::string& marker, const std::string& alias_name) {
    return marker + kRuleMarkerSeparator + "Block devices in " + alias_name + " alias";
}

} // namespace macfence
