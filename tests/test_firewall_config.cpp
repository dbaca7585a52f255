#include "errors.hpp"
#include "fake_transport.hpp"
#include "firewall_config.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>

using namespace macfence;
using Node = FirewallConfigDocument::Node;

namespace {

const std::vector<std::string> kMacs = {"AA:BB:CC:DD:EE:01", "AA:BB:CC:DD:EE:02"};

const char* kDocWithAlias =
    "<?xml version=\"1.0\"?>\n"
    "<opnsense>\n"
    "  <OPNsense>\n"
    "    <Firewall>\n"
    "      <Alias version=\"1.0.1\">\n"
    "        <aliases>\n"
    "          <alias uuid=\"keep-this-uuid\">\n"
    "            <enabled>1</enabled>\n"
    "            <name>ParentalControlMACs</name>\n"
    "            <type>mac</type>\n"
    "            <content>00:11:22:33:44:55</content>\n"
    "            <description>old</description>\n"
    "          </alias>\n"
    "          <alias uuid=\"other\">\n"
    "            <name>Servers</name>\n"
    "            <type>host</type>\n"
    "          </alias>\n"
    "        </aliases>\n"
    "      </Alias>\n"
    "    </Firewall>\n"
    "  </OPNsense>\n"
    "</opnsense>\n";

std::string attribute(Node node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (value == nullptr) {
        return "";
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

Node child(Node parent, const char* name) {
    for (Node node = parent->children; node != nullptr; node = node->next) {
        if (node->type == XML_ELEMENT_NODE && xmlStrEqual(node->name, reinterpret_cast<const xmlChar*>(name))) {
            return node;
        }
    }
    return nullptr;
}

} // namespace

class FirewallConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLogLevel(LogLevel::None);
    }
};

TEST_F(FirewallConfigTest, MalformedInputThrows) {
    EXPECT_THROW(FirewallConfigDocument::parse("<opnsense><filter></opnsense>"), MalformedDocumentError);
    EXPECT_THROW(FirewallConfigDocument::parse("not xml at all"), MalformedDocumentError);
    EXPECT_THROW(FirewallConfigDocument::parse(""), MalformedDocumentError);
}

TEST_F(FirewallConfigTest, UpsertAliasCreatesMissingSections) {
    auto doc = FirewallConfigDocument::parse(testutil::baseConfigXml());
    EXPECT_EQ(doc.findAlias("ParentalControlMACs"), nullptr);

    doc.upsertAlias("ParentalControlMACs", kMacs, "Parental Controls MAC Addresses (2 devices)");

    Node alias = doc.findAlias("ParentalControlMACs");
    ASSERT_NE(alias, nullptr);
    EXPECT_EQ(attribute(alias, "uuid").size(), 36u);
    EXPECT_EQ(FirewallConfigDocument::childText(alias, "enabled"), std::string("1"));
    EXPECT_EQ(FirewallConfigDocument::childText(alias, "type"), std::string("mac"));
    EXPECT_EQ(FirewallConfigDocument::childText(alias, "counters"), std::string("0"));
    EXPECT_EQ(FirewallConfigDocument::childText(alias, "content"),
              std::string("AA:BB:CC:DD:EE:01\nAA:BB:CC:DD:EE:02"));
    EXPECT_EQ(FirewallConfigDocument::childText(alias, "description"),
              std::string("Parental Controls MAC Addresses (2 devices)"));

    // alias -> aliases -> Alias, which got a version when it was created
    Node alias_section = alias->parent->parent;
    EXPECT_EQ(FirewallConfigDocument::childText(alias_section, "version"), std::string("1.0.1"));
}

TEST_F(FirewallConfigTest, UpsertAliasIsIdempotent) {
    auto doc = FirewallConfigDocument::parse(testutil::baseConfigXml());
    doc.upsertAlias("ParentalControlMACs", kMacs, "Parental Controls MAC Addresses (2 devices)");
    std::string first = doc.nodeToString(doc.findAlias("ParentalControlMACs"));

    doc.upsertAlias("ParentalControlMACs", kMacs, "Parental Controls MAC Addresses (2 devices)");
    std::string second = doc.nodeToString(doc.findAlias("ParentalControlMACs"));

    EXPECT_EQ(first, second);
}

TEST_F(FirewallConfigTest, UpsertAliasIsIdempotentAcrossSerialization) {
    auto doc = FirewallConfigDocument::parse(testutil::baseConfigXml());
    doc.upsertAlias("ParentalControlMACs", kMacs, "desc");
    auto reparsed = FirewallConfigDocument::parse(doc.serialize());
    std::string first = reparsed.nodeToString(reparsed.findAlias("ParentalControlMACs"));

    reparsed.upsertAlias("ParentalControlMACs", kMacs, "desc");
    EXPECT_EQ(reparsed.nodeToString(reparsed.findAlias("ParentalControlMACs")), first);
}

TEST_F(FirewallConfigTest, UpsertAliasRewritesExistingAliasInPlace) {
    auto doc = FirewallConfigDocument::parse(kDocWithAlias);
    doc.upsertAlias("ParentalControlMACs", kMacs, "new description");

    Node alias = doc.findAlias("ParentalControlMACs");
    ASSERT_NE(alias, nullptr);
    EXPECT_EQ(attribute(alias, "uuid"), "keep-this-uuid");
    EXPECT_EQ(FirewallConfigDocument::childText(alias, "content"),
              std::string("AA:BB:CC:DD:EE:01\nAA:BB:CC:DD:EE:02"));
    EXPECT_EQ(FirewallConfigDocument::childText(alias, "description"), std::string("new description"));

    // Sibling alias untouched
    Node servers = doc.findAlias("Servers");
    ASSERT_NE(servers, nullptr);
    EXPECT_EQ(FirewallConfigDocument::childText(servers, "type"), std::string("host"));

    std::string xml = doc.serialize();
    EXPECT_EQ(xml.find("00:11:22:33:44:55"), std::string::npos);
    EXPECT_EQ(xml.find("keep-this-uuid"), xml.rfind("keep-this-uuid"));
}

TEST_F(FirewallConfigTest, SerializeKeepsUnrelatedContent) {
    auto doc = FirewallConfigDocument::parse(testutil::baseConfigXml());
    doc.upsertAlias("ParentalControlMACs", kMacs, "desc");

    std::string xml = doc.serialize();
    EXPECT_NE(xml.find("<hostname>gateway</hostname>"), std::string::npos);
    EXPECT_NE(xml.find("Default allow LAN to any rule"), std::string::npos);

    auto reparsed = FirewallConfigDocument::parse(xml);
    EXPECT_NE(reparsed.findAlias("ParentalControlMACs"), nullptr);
}

TEST_F(FirewallConfigTest, FindRuleByDescriptionSubstring) {
    auto doc = FirewallConfigDocument::parse(testutil::baseConfigXml());
    EXPECT_NE(doc.findRuleByDescriptionSubstring("allow LAN"), nullptr);
    EXPECT_EQ(doc.findRuleByDescriptionSubstring("ParentalControlBlock"), nullptr);
}

TEST_F(FirewallConfigTest, MarkerTokenWinsOverSubstringMatch) {
    auto doc = FirewallConfigDocument::parse(
        "<opnsense><filter>"
        "<rule uuid=\"a\"><descr>Note: see ParentalControlBlock docs</descr></rule>"
        "<rule uuid=\"b\"><descr>ParentalControlBlock - Block devices in ParentalControlMACs alias</descr></rule>"
        "</filter></opnsense>");

    Node rule = doc.findRuleByMarker("ParentalControlBlock");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(attribute(rule, "uuid"), "b");

    // The substring lookup still returns the first hit
    EXPECT_EQ(attribute(doc.findRuleByDescriptionSubstring("ParentalControlBlock"), "uuid"), "a");
}

TEST_F(FirewallConfigTest, LegacySubstringMatchIsOptional) {
    auto doc = FirewallConfigDocument::parse(
        "<opnsense><filter>"
        "<rule uuid=\"legacy\"><descr>Parental Controls - ParentalControlBlock</descr></rule>"
        "<rule uuid=\"prefix\"><descr>ParentalControlBlockExtra</descr></rule>"
        "</filter></opnsense>");

    Node legacy = doc.findRuleByMarker("ParentalControlBlock", true);
    ASSERT_NE(legacy, nullptr);
    EXPECT_EQ(attribute(legacy, "uuid"), "legacy");

    EXPECT_EQ(doc.findRuleByMarker("ParentalControlBlock", false), nullptr);
}

TEST_F(FirewallConfigTest, UpsertBlockRuleCreatesDisabledRule) {
    auto doc = FirewallConfigDocument::parse(testutil::baseConfigXml());
    doc.upsertBlockRule("ParentalControlMACs", "ParentalControlBlock", false);

    Node rule = doc.findRuleByMarker("ParentalControlBlock", false);
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(attribute(rule, "uuid").size(), 36u);
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "type"), std::string("block"));
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "interface"), std::string("lan"));
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "ipprotocol"), std::string("inet46"));
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "statetype"), std::string("keep state"));
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "direction"), std::string("in"));
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "quick"), std::string("1"));
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "disabled"), std::string("1"));
    EXPECT_EQ(FirewallConfigDocument::childText(child(rule, "source"), "address"),
              std::string("ParentalControlMACs"));
    EXPECT_EQ(FirewallConfigDocument::childText(child(rule, "destination"), "any"), std::string("1"));
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "descr"),
              FirewallConfigDocument::ruleDescription("ParentalControlBlock", "ParentalControlMACs"));
    EXPECT_FALSE(FirewallConfigDocument::isRuleEnabled(rule));

    // The existing pass rule is still first
    EXPECT_NE(doc.findRuleByDescriptionSubstring("Default allow"), nullptr);
}

TEST_F(FirewallConfigTest, UpsertBlockRuleCreatesFilterSection) {
    auto doc = FirewallConfigDocument::parse("<opnsense><system/></opnsense>");
    doc.upsertBlockRule("ParentalControlMACs", "ParentalControlBlock", true, "opt1");

    Node rule = doc.findRuleByMarker("ParentalControlBlock");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "interface"), std::string("opt1"));
    EXPECT_TRUE(FirewallConfigDocument::isRuleEnabled(rule));
}

TEST_F(FirewallConfigTest, UpsertBlockRuleRewritesExistingRule) {
    auto doc = FirewallConfigDocument::parse(
        "<opnsense><filter>"
        "<rule uuid=\"existing\"><type>pass</type><descr>ParentalControlBlock</descr></rule>"
        "</filter></opnsense>");
    doc.upsertBlockRule("ParentalControlMACs", "ParentalControlBlock", true);

    Node rule = doc.findRuleByMarker("ParentalControlBlock");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(attribute(rule, "uuid"), "existing");
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "type"), std::string("block"));
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "disabled"), std::string("0"));
    EXPECT_EQ(doc.serialize().find("<type>pass</type>"), std::string::npos);
}

TEST_F(FirewallConfigTest, SetRuleEnabledFlipsOnlyDisabledFlag) {
    auto doc = FirewallConfigDocument::parse(testutil::baseConfigXml());
    doc.upsertBlockRule("ParentalControlMACs", "ParentalControlBlock", false);
    std::string before = doc.nodeToString(doc.findRuleByMarker("ParentalControlBlock"));

    ASSERT_TRUE(doc.setRuleEnabled("ParentalControlBlock", true));
    Node rule = doc.findRuleByMarker("ParentalControlBlock");
    EXPECT_TRUE(FirewallConfigDocument::isRuleEnabled(rule));

    std::string after = doc.nodeToString(rule);
    std::string expected = before;
    expected.replace(expected.find("<disabled>1</disabled>"), 22, "<disabled>0</disabled>");
    EXPECT_EQ(after, expected);
}

TEST_F(FirewallConfigTest, SetRuleEnabledAddsMissingFlag) {
    auto doc = FirewallConfigDocument::parse(
        "<opnsense><filter><rule><descr>ParentalControlBlock</descr></rule></filter></opnsense>");
    Node rule = doc.findRuleByMarker("ParentalControlBlock");
    EXPECT_TRUE(FirewallConfigDocument::isRuleEnabled(rule));

    ASSERT_TRUE(doc.setRuleEnabled("ParentalControlBlock", false));
    EXPECT_EQ(FirewallConfigDocument::childText(rule, "disabled"), std::string("1"));
    EXPECT_FALSE(FirewallConfigDocument::isRuleEnabled(rule));
}

TEST_F(FirewallConfigTest, SetRuleEnabledWithoutRuleFails) {
    auto doc = FirewallConfigDocument::parse(testutil::baseConfigXml());
    std::string before = doc.serialize();
    EXPECT_FALSE(doc.setRuleEnabled("ParentalControlBlock", true));
    EXPECT_EQ(doc.serialize(), before);
}

TEST_F(FirewallConfigTest, ChildTextDistinguishesMissingFromEmpty) {
    auto doc = FirewallConfigDocument::parse(testutil::baseConfigXml());
    doc.upsertAlias("ParentalControlMACs", kMacs, "desc");
    Node alias = doc.findAlias("ParentalControlMACs");

    EXPECT_EQ(FirewallConfigDocument::childText(alias, "proto"), std::string());
    EXPECT_FALSE(FirewallConfigDocument::childText(alias, "no_such_child").has_value());
}
