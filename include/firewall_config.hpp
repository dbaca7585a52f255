/**
 * @file firewall_config.hpp
 * @brief In-memory model of the OPNsense config.xml document
 * @author macfence Development Team
 * @date 2026
 *
 * FirewallConfigDocument wraps a libxml2 tree of the appliance's whole
 * configuration. Only two regions are touched:
 *
 *   opnsense/OPNsense/Firewall/Alias/aliases/alias   (MAC alias)
 *   opnsense/filter/rule                             (block rule)
 *
 * Everything else in the document is carried through unchanged. A document
 * lives for one reconciliation pass: fetched, patched, serialized, dropped.
 */

#pragma once

#include <libxml/tree.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace macfence {

/// Separator between the marker token and the human part of a rule description
constexpr const char* kRuleMarkerSeparator = " - ";

/**
 * @class FirewallConfigDocument
 * @brief Lookup and upsert operations on aliases and filter rules
 *
 * Node handles returned by the find functions are owned by the document and
 * stay valid until the next mutation of the same subtree or the document's
 * destruction. A null handle means "absent".
 */
class FirewallConfigDocument {
public:
    using Node = xmlNodePtr;

    /**
     * @brief Parse a serialized configuration
     * @param bytes Complete XML document
     * @return Parsed document
     * @throws MalformedDocumentError if the bytes are not well-formed XML or
     *         have no root element
     */
    static FirewallConfigDocument parse(const std::string& bytes);

    FirewallConfigDocument(FirewallConfigDocument&&) noexcept = default;
    FirewallConfigDocument& operator=(FirewallConfigDocument&&) noexcept = default;

    /**
     * @brief Serialize the whole document, XML declaration included
     */
    std::string serialize() const;

    /**
     * @brief Find an alias by exact name
     * @return The <alias> element, or nullptr
     */
    Node findAlias(const std::string& name) const;

    /**
     * @brief Create or rewrite the MAC alias
     * @param name Alias name
     * @param mac_list Canonical MACs, written newline-joined into <content>
     * @param description Free-text description
     *
     * An existing alias keeps its element and uuid attribute but has all of
     * its children replaced. A new alias gets a random uuid; the
     * OPNsense/Firewall/Alias/aliases chain is created where missing.
     */
    void upsertAlias(const std::string& name,
                     const std::vector<std::string>& mac_list,
                     const std::string& description);

    /**
     * @brief First filter rule whose <descr> contains the text
     * @return The <rule> element, or nullptr
     */
    Node findRuleByDescriptionSubstring(const std::string& marker) const;

    /**
     * @brief Find the rule owned by a marker token
     * @param marker Marker token, e.g. "ParentalControlBlock"
     * @param legacy_substring_match Fall back to a substring match when no
     *        description starts with the exact token
     * @return The <rule> element, or nullptr
     *
     * A description is owned by the marker when it equals the marker or
     * starts with marker followed by " - ".
     */
    Node findRuleByMarker(const std::string& marker, bool legacy_substring_match = true) const;

    /**
     * @brief Create or rewrite the block rule for an alias
     * @param alias_name Alias used as the rule's source address
     * @param marker Marker token that identifies the rule
     * @param enabled false writes disabled=1
     * @param interface Interface the rule is attached to
     * @param legacy_substring_match See findRuleByMarker()
     */
    void upsertBlockRule(const std::string& alias_name,
                         const std::string& marker,
                         bool enabled,
                         const std::string& interface = "lan",
                         bool legacy_substring_match = true);

    /**
     * @brief Flip only the <disabled> flag of the marker's rule
     * @return false if no rule matches
     */
    bool setRuleEnabled(const std::string& marker, bool enabled, bool legacy_substring_match = true);

    /**
     * @brief A rule is enabled unless it has <disabled>1</disabled>
     */
    static bool isRuleEnabled(Node rule);

    /**
     * @brief Text of a direct child element
     * @return Child text, or std::nullopt if the child is missing
     */
    static std::optional<std::string> childText(Node parent, const std::string& child_name);

    /**
     * @brief Serialize one element and its subtree
     */
    std::string nodeToString(Node node) const;

    /**
     * @brief Description written into rules created by upsertBlockRule()
     */
    static std::string ruleDescription(const std::string& marker, const std::string& alias_name);

private:
    using DocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

    explicit FirewallConfigDocument(DocPtr doc);

    DocPtr doc_;

    Node root() const;
    Node filterSection() const;
    std::vector<Node> rules() const;
};

} // namespace macfence
