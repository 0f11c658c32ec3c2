/*
Veneer — StyleSheetParser Tests
Role: Verify the Qt style sheet grammar and error recovery
Testing Strategy: Literal stylesheets → assert rules, selectors, declarations, diagnostics
Coverage: Selectors, groups, combinators, comments, url() values, malformed input
*/
#include <gtest/gtest.h>
#include "style/StyleSheetParser.hpp"

using namespace veneer;

// =============================================================================
// Selector Tests
// =============================================================================

TEST(StyleSheetParser, ParsesSimpleRule) {
    auto result = StyleSheetParser::parse("QPushButton { color: #E8E8E8; padding: 6px 12px; }");

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.sheet.size(), 1u);
    const auto& rule = result.sheet.rules()[0];
    ASSERT_EQ(rule.selectors.size(), 1u);
    EXPECT_EQ(rule.selectors[0].text(), "QPushButton");
    ASSERT_EQ(rule.declarations.size(), 2u);
    EXPECT_EQ(rule.declarations[0].property, "color");
    EXPECT_EQ(rule.declarations[0].value, "#E8E8E8");
    EXPECT_EQ(rule.declarations[1].property, "padding");
    EXPECT_EQ(rule.declarations[1].value, "6px 12px");
}

TEST(StyleSheetParser, ParsesSubControlAndPseudoStates) {
    auto result = StyleSheetParser::parse("QScrollBar::handle:vertical:hover { background-color: #505050; }");

    ASSERT_TRUE(result.ok());
    const auto& part = result.sheet.rules()[0].selectors[0].subject();
    EXPECT_EQ(part.typeName, "QScrollBar");
    EXPECT_EQ(part.subControl, "handle");
    ASSERT_EQ(part.pseudoStates.size(), 2u);
    EXPECT_EQ(part.pseudoStates[0].name, "vertical");
    EXPECT_EQ(part.pseudoStates[1].name, "hover");
    EXPECT_FALSE(part.pseudoStates[1].negated);
}

TEST(StyleSheetParser, ParsesNegatedPseudoState) {
    auto result = StyleSheetParser::parse("QTabBar::tab:hover:!selected { background-color: #2A2A2A; }");

    ASSERT_TRUE(result.ok());
    const auto& part = result.sheet.rules()[0].selectors[0].subject();
    ASSERT_EQ(part.pseudoStates.size(), 2u);
    EXPECT_TRUE(part.pseudoStates[1].negated);
    EXPECT_EQ(part.pseudoStates[1].name, "selected");
    EXPECT_EQ(result.sheet.rules()[0].selectors[0].text(), "QTabBar::tab:hover:!selected");
}

TEST(StyleSheetParser, ParsesSelectorGroup) {
    auto result = StyleSheetParser::parse("QScrollBar::add-line, QScrollBar::sub-line { border: none; }");

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.sheet.size(), 1u);
    const auto& rule = result.sheet.rules()[0];
    ASSERT_EQ(rule.selectors.size(), 2u);
    EXPECT_EQ(rule.selectors[0].text(), "QScrollBar::add-line");
    EXPECT_EQ(rule.selectors[1].text(), "QScrollBar::sub-line");
    EXPECT_EQ(rule.selectorText(), "QScrollBar::add-line, QScrollBar::sub-line");
}

TEST(StyleSheetParser, ParsesDescendantAndChildCombinators) {
    auto result = StyleSheetParser::parse(
        "QComboBox QAbstractItemView { color: #E8E8E8; }\n"
        "QDialog>QPushButton { color: #FFFFFF; }");

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.sheet.size(), 2u);

    const auto& descendant = result.sheet.rules()[0].selectors[0];
    ASSERT_EQ(descendant.parts.size(), 2u);
    EXPECT_EQ(descendant.combinators[0], Combinator::Descendant);
    EXPECT_EQ(descendant.subject().typeName, "QAbstractItemView");

    const auto& child = result.sheet.rules()[1].selectors[0];
    ASSERT_EQ(child.parts.size(), 2u);
    EXPECT_EQ(child.combinators[0], Combinator::Child);
    EXPECT_EQ(child.text(), "QDialog > QPushButton");
}

TEST(StyleSheetParser, WritesSubControlBeforePseudoStates) {
    auto result = StyleSheetParser::parse("QComboBox:editable::drop-down { border: none; }");
    ASSERT_TRUE(result.ok());

    const auto& part = result.sheet.rules()[0].selectors[0].parts[0];
    EXPECT_EQ(part.subControl, "drop-down");
    ASSERT_EQ(part.pseudoStates.size(), 1u);
    EXPECT_EQ(part.pseudoStates[0].name, "editable");
    EXPECT_EQ(result.sheet.rules()[0].selectorText(), "QComboBox::drop-down:editable");
}

TEST(StyleSheetParser, ParsesObjectNameAttributesAndExactType) {
    auto result = StyleSheetParser::parse(
        ".QWidget#central[flat=\"true\"] { border: none; }\n"
        "#okButton { color: #00AAFF; }\n"
        "* { outline: none; }");

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.sheet.size(), 3u);

    const auto& part = result.sheet.rules()[0].selectors[0].subject();
    EXPECT_TRUE(part.exactType);
    EXPECT_EQ(part.typeName, "QWidget");
    EXPECT_EQ(part.objectName, "central");
    ASSERT_EQ(part.attributes.size(), 1u);
    EXPECT_EQ(part.attributes[0], "flat=\"true\"");

    const auto& named = result.sheet.rules()[1].selectors[0].subject();
    EXPECT_TRUE(named.typeName.empty());
    EXPECT_EQ(named.objectName, "okButton");

    EXPECT_EQ(result.sheet.rules()[2].selectors[0].subject().typeName, "*");
}

// =============================================================================
// Declaration Tests
// =============================================================================

TEST(StyleSheetParser, KeepsUrlWithColonsAndSemicolons) {
    auto result = StyleSheetParser::parse(
        "QCheckBox::indicator:checked { image: url(:/icons/check;v2.svg); border: 1px solid #00AAFF; }");

    ASSERT_TRUE(result.ok());
    const auto& rule = result.sheet.rules()[0];
    ASSERT_EQ(rule.declarations.size(), 2u);
    EXPECT_EQ(rule.declarations[0].value, "url(:/icons/check;v2.svg)");
    EXPECT_EQ(rule.value("border"), "1px solid #00AAFF");
}

TEST(StyleSheetParser, KeepsWhitespaceInsideUrl) {
    auto result = StyleSheetParser::parse(
        "QCheckBox::indicator { image: url(/my  icons/check.svg);  border-image:  URL( \"a  b.png\" )  0 }");
    ASSERT_TRUE(result.ok());

    const auto& rule = result.sheet.rules()[0];
    EXPECT_EQ(rule.value("image"), "url(/my  icons/check.svg)");
    EXPECT_EQ(rule.value("border-image"), "URL( \"a  b.png\" ) 0");
}

TEST(StyleSheetParser, CollapsesWhitespaceButNotInsideStrings) {
    auto result = StyleSheetParser::parse(
        "QLabel {\n  font-family:   \"DejaVu   Sans\",\n    sans-serif ;\n  padding : 1px\t2px }");

    ASSERT_TRUE(result.ok());
    const auto& rule = result.sheet.rules()[0];
    EXPECT_EQ(rule.value("font-family"), "\"DejaVu   Sans\", sans-serif");
    EXPECT_EQ(rule.value("padding"), "1px 2px");
}

TEST(StyleSheetParser, LowercasesPropertiesExceptQProperties) {
    auto result = StyleSheetParser::parse("QLabel { Background-Color: #000000; qproperty-iconSize: 16px; }");

    ASSERT_TRUE(result.ok());
    const auto& rule = result.sheet.rules()[0];
    EXPECT_EQ(rule.declarations[0].property, "background-color");
    EXPECT_EQ(rule.declarations[1].property, "qproperty-iconSize");
}

TEST(StyleSheetParser, LastDeclarationMayOmitSemicolon) {
    auto result = StyleSheetParser::parse("QLabel { color: #E8E8E8 }");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.sheet.rules()[0].value("color"), "#E8E8E8");
}

TEST(StyleSheetParser, StripsComments) {
    auto result = StyleSheetParser::parse(
        "/* Tables */\n"
        "QTableView /* the view */ {\n"
        "    color: #C0C0C0; /* text */\n"
        "    /* border: none; */\n"
        "}\n");

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.sheet.size(), 1u);
    const auto& rule = result.sheet.rules()[0];
    EXPECT_EQ(rule.selectors[0].text(), "QTableView");
    ASSERT_EQ(rule.declarations.size(), 1u);
    EXPECT_EQ(rule.declarations[0].value, "#C0C0C0");
}

TEST(StyleSheetParser, RecordsLineNumbers) {
    auto result = StyleSheetParser::parse(
        "QLabel {\n"
        "    color: #E8E8E8;\n"
        "}\n"
        "\n"
        "QMenu {\n"
        "    border: none;\n"
        "    padding: 4px;\n"
        "}\n");

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.sheet.size(), 2u);
    EXPECT_EQ(result.sheet.rules()[0].line, 1);
    EXPECT_EQ(result.sheet.rules()[0].declarations[0].line, 2);
    EXPECT_EQ(result.sheet.rules()[1].line, 5);
    EXPECT_EQ(result.sheet.rules()[1].declarations[1].line, 7);
}

TEST(StyleSheetParser, EmptyInputProducesEmptySheet) {
    auto result = StyleSheetParser::parse("  \n /* nothing */ \n");
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.sheet.empty());
}

TEST(StyleSheetParser, EmptyBlockIsKept) {
    auto result = StyleSheetParser::parse("QFrame { }");
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.sheet.size(), 1u);
    EXPECT_TRUE(result.sheet.rules()[0].declarations.empty());
}

// =============================================================================
// Error Recovery Tests
// =============================================================================

TEST(StyleSheetParser, MalformedSelectorDropsOnlyThatRule) {
    auto result = StyleSheetParser::parse(
        "QLabel { color: #111111; }\n"
        "QPushButton: { color: #222222; }\n"
        "QMenu { color: #333333; }");

    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.sheet.size(), 2u);
    EXPECT_EQ(result.sheet.rules()[0].selectors[0].text(), "QLabel");
    EXPECT_EQ(result.sheet.rules()[1].selectors[0].text(), "QMenu");
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].line, 2);
    EXPECT_EQ(result.diagnostics[0].severity, Severity::Error);
}

TEST(StyleSheetParser, RejectsBadSelectorCharacters) {
    for (const char* text : {"QLabel@x { color: #111111; }",
                             "QMenu > { color: #111111; }",
                             "QLabel, { color: #111111; }",
                             "QCheckBox::indicator::checked { color: #111111; }",
                             "QLabel# { color: #111111; }",
                             "QLabel[flat { color: #111111; }",
                             "{ color: #111111; }"}) {
        auto result = StyleSheetParser::parse(text);
        EXPECT_FALSE(result.ok()) << text;
        EXPECT_TRUE(result.sheet.empty()) << text;
    }
}

TEST(StyleSheetParser, MalformedDeclarationDropsOnlyThatDeclaration) {
    auto result = StyleSheetParser::parse("QLabel { color #111111; padding: 4px; margin: ; }");

    EXPECT_EQ(result.errorCount(), 2u);
    ASSERT_EQ(result.sheet.size(), 1u);
    const auto& rule = result.sheet.rules()[0];
    ASSERT_EQ(rule.declarations.size(), 1u);
    EXPECT_EQ(rule.declarations[0].property, "padding");
}

TEST(StyleSheetParser, UnterminatedBlockIsReportedAndDropped) {
    auto result = StyleSheetParser::parse("QLabel { color: #111111; }\nQMenu { color: #222222;");

    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.sheet.size(), 1u);
    EXPECT_EQ(result.sheet.rules()[0].selectors[0].text(), "QLabel");
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].line, 2);
}

TEST(StyleSheetParser, UnterminatedCommentIsReported) {
    auto result = StyleSheetParser::parse("QLabel { color: #111111; }\n/* never closed");

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.sheet.size(), 1u);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_NE(result.diagnostics[0].message.find("comment"), std::string::npos);
}

TEST(StyleSheetParser, UnterminatedStringIsReported) {
    auto result = StyleSheetParser::parse(
        "QLabel {\n"
        "    font-family: \"Sans;\n"
        "    color: #111111;\n"
        "}\n"
        "QMenu { color: #222222; }");

    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_NE(result.diagnostics[0].message.find("unterminated string"), std::string::npos);
    EXPECT_EQ(result.diagnostics[0].line, 2);

    // Only the declaration holding the string is lost
    ASSERT_EQ(result.sheet.size(), 2u);
    const auto& label = result.sheet.rules()[0];
    EXPECT_EQ(label.selectorText(), "QLabel");
    ASSERT_EQ(label.declarations.size(), 1u);
    EXPECT_EQ(label.value("color"), "#111111");
    EXPECT_EQ(result.sheet.rules()[1].value("color"), "#222222");
}

TEST(StyleSheetParser, UnterminatedStringSwallowingBraceKeepsLaterRules) {
    auto result = StyleSheetParser::parse(
        "QLabel { font-family: \"Arial; }\n"
        "QPushButton { color: #ffffff; }\n"
        "QMenu { color: #000000; }\n");

    EXPECT_EQ(result.errorCount(), 2u);
    ASSERT_EQ(result.sheet.size(), 2u);
    EXPECT_EQ(result.sheet.rules()[0].selectorText(), "QPushButton");
    EXPECT_EQ(result.sheet.rules()[0].line, 2);
    EXPECT_EQ(result.sheet.rules()[0].value("color"), "#ffffff");
    EXPECT_EQ(result.sheet.rules()[1].selectorText(), "QMenu");
    EXPECT_EQ(result.sheet.rules()[1].value("color"), "#000000");
}

TEST(StyleSheetParser, UnclosedBlockEndsAtNextRule) {
    auto result = StyleSheetParser::parse(
        "QLabel { color: #111111;\n"
        "QMenu { color: #222222; }");

    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_NE(result.diagnostics[0].message.find("missing '}'"), std::string::npos);
    EXPECT_EQ(result.diagnostics[0].line, 1);
    ASSERT_EQ(result.sheet.size(), 1u);
    EXPECT_EQ(result.sheet.rules()[0].selectorText(), "QMenu");
}

TEST(StyleSheetParser, UnterminatedStringInSelectorDropsRule) {
    auto result = StyleSheetParser::parse(
        "QLabel[text=\"abc\n] { color: #111111; }\n"
        "QMenu { color: #222222; }");

    ASSERT_EQ(result.errorCount(), 1u);
    ASSERT_EQ(result.sheet.size(), 1u);
    EXPECT_EQ(result.sheet.rules()[0].selectorText(), "QMenu");
}

TEST(StyleSheetParser, StrayClosingBraceIsSkipped) {
    auto result = StyleSheetParser::parse("} QLabel { color: #111111; }");

    EXPECT_EQ(result.errorCount(), 1u);
    ASSERT_EQ(result.sheet.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].column, 1);
}

TEST(StyleSheetParser, SelectorWithoutBlockIsReported) {
    auto result = StyleSheetParser::parse("QLabel color: red; }\nQMenu { color: #333333; }");

    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.sheet.size(), 1u);
    EXPECT_EQ(result.sheet.rules()[0].selectors[0].text(), "QMenu");
}

// =============================================================================
// Brace-less Declaration Lists
// =============================================================================

TEST(StyleSheetParser, ParsesBareDeclarationList) {
    auto result = StyleSheetParser::parseDeclarations("color: #CCCCCC; font-size: 11px; /* note */");

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.sheet.size(), 1u);
    const auto& rule = result.sheet.rules()[0];
    EXPECT_TRUE(rule.selectors.empty());
    EXPECT_EQ(rule.value("color"), "#CCCCCC");
    EXPECT_EQ(rule.value("font-size"), "11px");
}

TEST(StyleSheetParser, BareDeclarationListRejectsBlocks) {
    auto result = StyleSheetParser::parseDeclarations("QLabel { color: #CCCCCC; }");
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.sheet.empty());
}
