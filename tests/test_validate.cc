#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>
#include <map>
#include <string>
#include <vector>

#include "ghostfield.h"

namespace {

// 2023-11-14 22:13:20 UTC
const time_t NOW = 1700000000;
const std::string UA = "Mozilla/5.0 (X11; Linux x86_64; rv:128.0) Gecko/20100101 Firefox/128.0";

class ValidateTest : public ::testing::Test {
   protected:
    ValidateTest() : gf("secret", NOW, true) {}

    void SetUp() override {
        gf.create_fields();
        gf.add_legit("name").add_legit("message", "textarea");
    }

    // legit fields filled, every honeypot submitted empty
    FormData honest_submission(const std::string &bucket) {
        FormData data;
        for (size_t i = 0; i < gf.get_fields().size(); i++) {
            const GfField &field = gf.get_fields()[i];
            std::string id = derive_wire_id(field.getname(), "secret", bucket);
            if (field.islegit()) {
                data[id] = "value of " + field.getname();
            } else {
                data[id] = "";
            }
        }
        return data;
    }

    GhostField gf;
};

}  // namespace

TEST_F(ValidateTest, HonestSubmissionPasses) {
    FormData data = honest_submission(gf.get_timestamp());
    EXPECT_TRUE(gf.validate(data, UA));

    std::map<std::string, std::string> legit = gf.get_data(data);
    ASSERT_EQ(legit.size(), 2u);
    EXPECT_EQ(legit["name"], "value of name");
    EXPECT_EQ(legit["message"], "value of message");
}

TEST_F(ValidateTest, MissingHoneypotsPass) {
    FormData data;
    data[gf.get_id("name")] = "John";
    EXPECT_TRUE(gf.validate(data, UA));
}

TEST_F(ValidateTest, FilledHoneypotFails) {
    FormData data = honest_submission(gf.get_timestamp());
    data[gf.get_id("user_email")] = "bot@example.com";
    EXPECT_FALSE(gf.validate(data, UA));
}

TEST_F(ValidateTest, WhitespaceCountsAsFilled) {
    FormData data = honest_submission(gf.get_timestamp());
    data[gf.get_id("user_city")] = " ";
    EXPECT_FALSE(gf.validate(data, UA));
}

TEST_F(ValidateTest, ZeroCountsAsFilled) {
    FormData data = honest_submission(gf.get_timestamp());
    data[gf.get_id("rgpd_accept")] = "0";
    EXPECT_FALSE(gf.validate(data, UA));
}

TEST_F(ValidateTest, FilledHoneypotOfPreviousHourFails) {
    FormData data = honest_submission(gf.get_timestamp());
    data[derive_wire_id("user_zip", "secret", "2023-11-14 21")] = "12345";
    EXPECT_FALSE(gf.validate(data, UA));
}

TEST_F(ValidateTest, HoneypotOfOlderHourIsIgnored) {
    FormData data = honest_submission(gf.get_timestamp());
    data[derive_wire_id("user_zip", "secret", "2023-11-14 20")] = "12345";
    EXPECT_TRUE(gf.validate(data, UA));
}

TEST_F(ValidateTest, ValidateIsRepeatable) {
    FormData data = honest_submission(gf.get_timestamp());
    EXPECT_TRUE(gf.validate(data, UA));
    EXPECT_TRUE(gf.validate(data, UA));
}

TEST_F(ValidateTest, ExtractionFallsBackToPreviousHour) {
    // page rendered before the hour changed
    std::string previous = time_bucket(NOW - 3601, true);
    ASSERT_EQ(previous, "2023-11-14 21");

    FormData data = honest_submission(previous);
    EXPECT_TRUE(gf.validate(data, UA));

    std::map<std::string, std::string> legit = gf.get_data(data);
    ASSERT_EQ(legit.size(), 2u);
    EXPECT_EQ(legit["name"], "value of name");
    EXPECT_EQ(legit["message"], "value of message");
}

TEST_F(ValidateTest, ExtractionDoesNotMixHours) {
    FormData data;
    data[gf.get_id("name")] = "current";
    data[derive_wire_id("message", "secret", "2023-11-14 21")] = "previous";

    std::map<std::string, std::string> legit = gf.get_data(data);
    ASSERT_EQ(legit.size(), 1u);
    EXPECT_EQ(legit["name"], "current");
}

TEST_F(ValidateTest, ExtractionKeepsEmptyValues) {
    FormData data;
    data[gf.get_id("name")] = "";

    std::map<std::string, std::string> legit = gf.get_data(data);
    ASSERT_EQ(legit.size(), 1u);
    EXPECT_EQ(legit["name"], "");
}

TEST_F(ValidateTest, ExtractionIgnoresHoneypots) {
    FormData data = honest_submission(gf.get_timestamp());
    data[gf.get_id("user_email")] = "bot@example.com";
    EXPECT_EQ(gf.get_data(data).count("user_email"), 0u);
}

TEST_F(ValidateTest, ExtractionOfUnknownIdsIsEmpty) {
    FormData data;
    data["name"] = "John";
    EXPECT_TRUE(gf.get_data(data).empty());
}

class SigilValidateTest : public ValidateTest {
   protected:
    void SetUp() override {
        ValidateTest::SetUp();
        gf.set_sigil();
    }

    // what the browser submits after running the hiding script
    FormData js_submission(const std::string &bucket, const std::string &useragent) {
        FormData data = honest_submission(bucket);
        std::string t = gf.get_field("sigil_time")->getvalue();
        data[derive_wire_id("sigil_time", "secret", bucket)] = t;
        data[derive_wire_id("sigil", "secret", bucket)] = sigil_proof(useragent, t);
        return data;
    }
};

TEST_F(SigilValidateTest, CorrectProofPasses) {
    EXPECT_TRUE(gf.validate(js_submission(gf.get_timestamp(), UA), UA));
}

TEST_F(SigilValidateTest, ProofOfPreviousHourPasses) {
    EXPECT_TRUE(gf.validate(js_submission("2023-11-14 21", UA), UA));
}

TEST_F(SigilValidateTest, OtherUserAgentFails) {
    EXPECT_FALSE(gf.validate(js_submission(gf.get_timestamp(), UA), "curl/8.5.0"));
}

TEST_F(SigilValidateTest, PlaceholderTokenFails) {
    // browser without javascript sends the values as rendered
    FormData data = honest_submission(gf.get_timestamp());
    data[gf.get_id("sigil_time")] = gf.get_field("sigil_time")->getvalue();
    data[gf.get_id("sigil")] = gf.get_field("sigil")->getvalue();
    EXPECT_FALSE(gf.validate(data, UA));
}

TEST_F(SigilValidateTest, MissingProofFails) {
    FormData data = js_submission(gf.get_timestamp(), UA);
    data.erase(gf.get_id("sigil"));
    EXPECT_FALSE(gf.validate(data, UA));
}

TEST_F(SigilValidateTest, EmptyTimeFails) {
    FormData data = js_submission(gf.get_timestamp(), UA);
    data[gf.get_id("sigil_time")] = "";
    EXPECT_FALSE(gf.validate(data, UA));
}

TEST_F(SigilValidateTest, TamperedProofFails) {
    FormData data = js_submission(gf.get_timestamp(), UA);
    data[gf.get_id("sigil")] = "tck_00000000";
    EXPECT_FALSE(gf.validate(data, UA));
}

TEST_F(SigilValidateTest, FilledSigilIsNoHoneypot) {
    // sigil values are never a trip wire, only the proof decides
    EXPECT_TRUE(gf.validate(js_submission(gf.get_timestamp(), UA), UA));
    FormData data = js_submission(gf.get_timestamp(), UA);
    data[derive_wire_id("sigil", "secret", "2023-11-14 21")] = "anything";
    EXPECT_TRUE(gf.validate(data, UA));
}

TEST_F(SigilValidateTest, HoneypotStillCheckedWithSigil) {
    FormData data = js_submission(gf.get_timestamp(), UA);
    data[gf.get_id("csrf_token")] = "x";
    EXPECT_FALSE(gf.validate(data, UA));
}

TEST(SigilOffTest, NoSigilNoCheck) {
    GhostField gf("secret", NOW, true);
    gf.add_legit("name");
    FormData data;
    data[gf.get_id("name")] = "John";
    EXPECT_TRUE(gf.validate(data, ""));
}

TEST(BucketTest, RepeatedHourIsCheckedOnce) {
    // end of DST in central europe, 02:30 CET is one hour after 02:30 CEST
    const char *oldtz = getenv("TZ");
    std::string saved = oldtz ? oldtz : "";
    setenv("TZ", "CET-1CEST,M3.5.0,M10.5.0/3", 1);
    tzset();

    // 2023-10-29 01:30:00 UTC
    GhostField gf("secret", 1698543000, false);
    std::vector<std::string> ts = gf.get_timestamps();

    if (oldtz) {
        setenv("TZ", saved.c_str(), 1);
    } else {
        unsetenv("TZ");
    }
    tzset();

    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0], "2023-10-29 02");
}

TEST(BucketTest, UtcHasTwoBucketsOnTheHour) {
    // exactly on the hour the previous bucket still differs
    GhostField gf("secret", 1699999200, true);
    std::vector<std::string> ts = gf.get_timestamps();
    ASSERT_EQ(ts.size(), 2u);
    EXPECT_EQ(ts[0], "2023-11-14 22");
    EXPECT_EQ(ts[1], "2023-11-14 21");
}
