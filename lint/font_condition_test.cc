#include "lint/font_condition.h"

#include <optional>

#include "gtest/gtest.h"
#include "lint/errors.h"
#include "lint/font_info.h"

namespace lint {

class FontConditionTest : public ::testing::Test {
 protected:
  FontConditionTest() {
    font_.filename = "NotoSansDevanagari-Bold.ttf";
    font_.name = "Noto Sans Devanagari";
    font_.style = "Sans";
    font_.script = "Deva";
    font_.variant = "UI";
    font_.weight = "700";
    font_.hinted = true;
    font_.vendor = "Monotype";
    font_.version = "1.10";
  }

  bool Accepts(absl::string_view line) {
    FontCondition condition;
    auto status = condition.ModifyLine(line);
    EXPECT_TRUE(status.ok()) << status;
    return condition.Accepts(font_);
  }

  FontInfo font_;
};

TEST_F(FontConditionTest, EmptyConditionAcceptsEverything) {
  FontCondition condition;
  ASSERT_TRUE(condition.IsUnconstrained());
  ASSERT_TRUE(condition.Accepts(font_));
  ASSERT_TRUE(condition.Accepts(FontInfo()));
}

TEST_F(FontConditionTest, Literal) {
  ASSERT_TRUE(Accepts("script Deva"));
  ASSERT_FALSE(Accepts("script Beng"));
  ASSERT_TRUE(Accepts("vendor \"Monotype\""));
  ASSERT_TRUE(Accepts("hinted true"));
  ASSERT_FALSE(Accepts("hinted false"));

  FontCondition condition;
  ASSERT_TRUE(condition.ModifyLine("script Deva").ok());
  ASSERT_FALSE(condition.Accepts(FontInfo()));
}

TEST_F(FontConditionTest, NumericRelations) {
  ASSERT_TRUE(Accepts("weight >= 700"));
  ASSERT_TRUE(Accepts("weight > 400"));
  ASSERT_FALSE(Accepts("weight < 700"));
  ASSERT_TRUE(Accepts("weight <= 700"));
  ASSERT_TRUE(Accepts("weight == 700.0"));
  ASSERT_FALSE(Accepts("weight != 700"));

  // Versions compare as numbers, not strings.
  ASSERT_TRUE(Accepts("version > 1.09"));
  ASSERT_TRUE(Accepts("version < 1.2"));
  ASSERT_TRUE(Accepts("version == 1.1"));
}

TEST_F(FontConditionTest, NonNumericRelations) {
  ASSERT_TRUE(Accepts("vendor == \"Monotype\""));
  ASSERT_TRUE(Accepts("vendor != Adobe"));
  ASSERT_FALSE(Accepts("vendor != Monotype"));
  ASSERT_FALSE(Accepts("vendor > 1"));
  ASSERT_FALSE(Accepts("weight < Bold"));

  FontCondition condition;
  ASSERT_TRUE(condition.ModifyLine("weight >= 400").ok());
  ASSERT_FALSE(condition.Accepts(FontInfo()));
}

TEST_F(FontConditionTest, Is) {
  ASSERT_TRUE(Accepts("style is Sans"));
  ASSERT_FALSE(Accepts("style is Serif"));
  ASSERT_FALSE(Accepts("version is 1.1"));
}

TEST_F(FontConditionTest, In) {
  ASSERT_TRUE(Accepts("script in Beng,Deva,Gujr"));
  ASSERT_TRUE(Accepts("script in Beng, Deva"));
  ASSERT_FALSE(Accepts("script in Beng,Gujr"));
  ASSERT_TRUE(Accepts("script in Deva"));
}

TEST_F(FontConditionTest, Like) {
  ASSERT_TRUE(Accepts("name like Devanagari"));
  ASSERT_TRUE(Accepts("name like ^Noto Sans"));
  ASSERT_FALSE(Accepts("name like ^Sans"));
  ASSERT_TRUE(Accepts("filename like -Bold\\.ttf$"));
}

TEST_F(FontConditionTest, Conjunction) {
  FontCondition condition;
  ASSERT_TRUE(condition.ModifyLine("script Deva").ok());
  ASSERT_TRUE(condition.ModifyLine("weight >= 400").ok());
  ASSERT_TRUE(condition.Accepts(font_));

  ASSERT_TRUE(condition.ModifyLine("vendor Adobe").ok());
  ASSERT_FALSE(condition.Accepts(font_));

  // '*' removes the constraint again.
  ASSERT_TRUE(condition.ModifyLine("vendor *").ok());
  ASSERT_TRUE(condition.Accepts(font_));
  ASSERT_EQ(condition.TestFor("vendor"), nullptr);
}

TEST_F(FontConditionTest, LaterModifyReplacesField) {
  FontCondition condition;
  ASSERT_TRUE(condition.Modify("script", "Beng", std::nullopt).ok());
  ASSERT_FALSE(condition.Accepts(font_));
  ASSERT_TRUE(condition.Modify("script", "in", "Beng,Deva").ok());
  ASSERT_TRUE(condition.Accepts(font_));

  const AttributeTest* test = condition.TestFor("script");
  ASSERT_NE(test, nullptr);
  ASSERT_EQ(test->relation(), AttributeTest::IN);
  ASSERT_EQ(test->operand(), "Beng,Deva");
}

TEST_F(FontConditionTest, UnknownField) {
  FontCondition condition;
  auto status = condition.ModifyLine("monospace true");
  ASSERT_TRUE(absl::IsInvalidArgument(status)) << status;
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kGrammar);

  status = condition.ModifyLine("color is red");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kGrammar);
}

TEST_F(FontConditionTest, UnknownRelation) {
  FontCondition condition;
  auto status = condition.ModifyLine("name Noto Sans");
  ASSERT_TRUE(absl::IsInvalidArgument(status)) << status;
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kUnsupportedRelation);

  status = condition.ModifyLine("weight =~ 400");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kUnsupportedRelation);
}

TEST_F(FontConditionTest, Malformed) {
  FontCondition condition;
  auto status = condition.ModifyLine("script");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kGrammar);

  status = condition.ModifyLine("name like ([");
  ASSERT_EQ(ErrorKindOf(status), ErrorKind::kGrammar);
}

TEST_F(FontConditionTest, ToString) {
  FontCondition condition;
  ASSERT_EQ(condition.ToString(), "FontCondition()");
  ASSERT_TRUE(condition.ModifyLine("script Deva").ok());
  ASSERT_TRUE(condition.ModifyLine("version >= 1.5").ok());
  ASSERT_EQ(condition.ToString(),
            "FontCondition(script: Deva, version: >= 1.5)");
}

}  // namespace lint
