#include <gtest/gtest.h>
#include <bninf/evidence.h>
#include <bninf/exceptions.h>
#include <bninf/trim.h>

using bninf::Evidence;
using bninf::EvidenceList;
using bninf::EvidenceVariable;
using bninf::QueryException;

TEST(TrimTest, RemovesSurroundingWhiteSpace) {
    std::string text = " \t rain = T \n";
    bninf::Trim(text);
    EXPECT_EQ(text, "rain = T");

    std::string blank = "   ";
    bninf::Trim(blank);
    EXPECT_TRUE(blank.empty());
}

TEST(EvidenceTest, ParseConditionalQuery) {
    Evidence evidence;
    evidence.Parse("sprinkler = T | rain=T ,cloudy= F");

    ASSERT_TRUE(evidence.HaveQueryVariable());
    EXPECT_EQ(evidence.GetQueryVariable(), EvidenceVariable("sprinkler", "T"));
    ASSERT_EQ(evidence.Size(), 2u);
    EXPECT_EQ(evidence.GetEvidenceList()[0], EvidenceVariable("rain", "T"));
    EXPECT_EQ(evidence.GetEvidenceList()[1], EvidenceVariable("cloudy", "F"));
    EXPECT_EQ(evidence.GetQueryString(), "sprinkler=T | rain=T, cloudy=F");
}

TEST(EvidenceTest, SingleAssignmentIsQueryVariable) {
    Evidence evidence;
    evidence.Parse("rain=T");

    ASSERT_TRUE(evidence.HaveQueryVariable());
    EXPECT_EQ(evidence.GetQueryVariable(), EvidenceVariable("rain", "T"));
    EXPECT_TRUE(evidence.Empty());
    EXPECT_EQ(evidence.GetQueryString(), "rain=T");
}

TEST(EvidenceTest, AssignmentListHasNoQueryVariable) {
    Evidence evidence;
    evidence.Parse("rain=T, sprinkler=F");

    EXPECT_FALSE(evidence.HaveQueryVariable());
    EXPECT_THROW(evidence.GetQueryVariable(), QueryException);
    EXPECT_EQ(evidence.Size(), 2u);
    EXPECT_EQ(evidence.GetQueryString(), "rain=T, sprinkler=F");
}

TEST(EvidenceTest, ParseEmptyClears) {
    Evidence evidence;
    evidence.Parse("a=x | b=y");
    evidence.Parse("  ");

    EXPECT_FALSE(evidence.HaveQueryVariable());
    EXPECT_TRUE(evidence.Empty());
}

TEST(EvidenceTest, SyntaxErrors) {
    Evidence evidence;
    EXPECT_THROW(evidence.Parse("a=x | b=y | c=z"), QueryException);
    EXPECT_THROW(evidence.Parse("a=x, b=y | c=z"), QueryException);
    EXPECT_THROW(evidence.Parse("a"), QueryException);
    EXPECT_THROW(evidence.Parse("a=x=y"), QueryException);
    EXPECT_THROW(evidence.Parse("=x"), QueryException);
    EXPECT_THROW(evidence.Parse("a= "), QueryException);
    EXPECT_THROW(evidence.Parse("a=x,"), QueryException);
    EXPECT_THROW(evidence.Parse("a=x | a=y"), QueryException);
}

TEST(EvidenceTest, ParseAssignments) {
    EvidenceList list = Evidence::ParseAssignments(" rain = T , sprinkler=F ");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], EvidenceVariable("rain", "T"));
    EXPECT_EQ(list[1], EvidenceVariable("sprinkler", "F"));

    EXPECT_TRUE(Evidence::ParseAssignments("").empty());

    try {
        Evidence::ParseAssignments("rain=T, rain=F");
        FAIL() << "duplicate variable accepted";
    } catch (QueryException &exception) {
        EXPECT_NE(std::string(exception.what()).find("rain"), std::string::npos);
    }
}

TEST(EvidenceTest, FindReturnsFirstAssignment) {
    Evidence evidence;
    evidence.Add(EvidenceVariable("rain", "T"));
    evidence.Add(EvidenceVariable("cloudy", "F"));
    evidence.Add(EvidenceVariable("rain", "F"));

    ASSERT_NE(evidence.Find("rain"), (const EvidenceVariable*)NULL);
    EXPECT_EQ(evidence.Find("rain")->value, "T");
    EXPECT_TRUE(evidence.HasEvidence("cloudy"));
    EXPECT_FALSE(evidence.HasEvidence("sprinkler"));
    EXPECT_EQ(evidence.Find("sprinkler"), (const EvidenceVariable*)NULL);

    evidence.Clear();
    EXPECT_TRUE(evidence.Empty());
}

TEST(EvidenceTest, AssignmentString) {
    EXPECT_EQ(Evidence::GetAssignmentString(EvidenceVariable("grass_wet", "T")), "grass_wet=T");
}
