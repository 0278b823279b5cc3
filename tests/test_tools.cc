#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <sys/wait.h>

#include <yaml-cpp/yaml.h>

#include "gf_util.h"

namespace {

// 2023-11-14 22:13:20 UTC
const char *NOW = "1700000000";
const std::string UA = "Mozilla/5.0";

struct ToolResult {
    int status;
    std::string out;
};

// run a command line, stdout is captured, stderr discarded
ToolResult run(const std::string &cmd) {
    ToolResult r;
    r.status = -1;
    FILE *p = popen((cmd + " 2>/dev/null").c_str(), "r");
    if (p == NULL) {
        return r;
    }
    char buf[512];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), p)) > 0) {
        r.out.append(buf, n);
    }
    int status = pclose(p);
    if (WIFEXITED(status)) {
        r.status = WEXITSTATUS(status);
    }
    return r;
}

class ToolTest : public ::testing::Test {
   protected:
    void SetUp() override {
        conf = ::testing::TempDir() + "gf_tools.conf";
        body = ::testing::TempDir() + "gf_tools.body";
        std::ofstream out(conf.c_str());
        out << "key: fromfile\n"
               "honeypots: [user_email, user_city]\n"
               "legit:\n"
               "  - [name, text, Your name]\n"
               "  - message\n";
    }

    void TearDown() override {
        std::remove(conf.c_str());
        std::remove(body.c_str());
    }

    std::string common() const {
        return std::string(" -c ") + conf + " -k secret --now " + NOW + " --utc";
    }

    void write_body(const std::string &content) {
        std::ofstream out(body.c_str());
        out << content;
    }

    ToolResult validate(const std::string &extra = "") {
        return run(std::string(GF_VALIDATE_BIN) + common() + " -A '" + UA + "' " + extra + " " + body);
    }

    std::string id(const std::string &name) const {
        return derive_wire_id(name, "secret", "2023-11-14 22");
    }

    std::string conf;
    std::string body;
};

}  // namespace

TEST_F(ToolTest, RenderPrintsWireIds) {
    ToolResult r = run(std::string(GF_RENDER_BIN) + common() + " --ids");
    ASSERT_EQ(r.status, 0);
    YAML::Node ids = YAML::Load(r.out);
    EXPECT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids["user_email"].as<std::string>(), id("user_email"));
    EXPECT_EQ(ids["name"].as<std::string>(), id("name"));
}

TEST_F(ToolTest, RenderedIdsAreAcceptedByValidate) {
    ToolResult ids = run(std::string(GF_RENDER_BIN) + common() + " --ids");
    ASSERT_EQ(ids.status, 0);
    YAML::Node node = YAML::Load(ids.out);

    write_body(node["name"].as<std::string>() + "=John+Doe&" + node["message"].as<std::string>() +
               "=hi%21&" + node["user_email"].as<std::string>() + "=\r\n");
    ToolResult r = validate();
    ASSERT_EQ(r.status, 0);
    YAML::Node data = YAML::Load(r.out);
    EXPECT_EQ(data.size(), 2u);
    EXPECT_EQ(data["name"].as<std::string>(), "John Doe");
    EXPECT_EQ(data["message"].as<std::string>(), "hi!");
}

TEST_F(ToolTest, ValidateRejectsFilledHoneypot) {
    write_body(id("name") + "=John&" + id("user_email") + "=bot%40example.com");
    ToolResult r = validate();
    EXPECT_EQ(r.status, 2);
    EXPECT_EQ(r.out, "");
}

TEST_F(ToolTest, ValidateReadsStdin) {
    write_body(id("user_city") + "=Paris");
    ToolResult r = run(std::string(GF_VALIDATE_BIN) + common() + " < " + body);
    EXPECT_EQ(r.status, 2);

    write_body(id("name") + "=John");
    r = run(std::string(GF_VALIDATE_BIN) + common() + " < " + body);
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(YAML::Load(r.out)["name"].as<std::string>(), "John");
}

TEST_F(ToolTest, ValidateUsesKeyFromCommandLine) {
    // ids of the key in the config file are unknown to the validator
    write_body(derive_wire_id("user_email", "fromfile", "2023-11-14 22") + "=x&" +
               derive_wire_id("name", "fromfile", "2023-11-14 22") + "=John");
    ToolResult r = validate();
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(YAML::Load(r.out).size(), 0u);
}

TEST_F(ToolTest, ValidateChecksSigilWithReferenceClient) {
    std::string t = sha1_hex(NOW);
    ToolResult proof = run(std::string(GF_SIGIL_BIN) + " -A '" + UA + "' -t " + t);
    ASSERT_EQ(proof.status, 0);
    std::string p = proof.out.substr(0, proof.out.find('\n'));
    EXPECT_EQ(p, sigil_proof(UA, t));

    write_body(id("name") + "=John&" + id("sigil_time") + "=" + t + "&" + id("sigil") + "=" + p);
    EXPECT_EQ(validate("-s sigil").status, 0);

    // same body from another browser
    ToolResult r = run(std::string(GF_VALIDATE_BIN) + common() + " -s sigil -A curl/8.5.0 " + body);
    EXPECT_EQ(r.status, 2);

    write_body(id("name") + "=John");
    EXPECT_EQ(validate("-s sigil").status, 2);
}

TEST_F(ToolTest, ValidateErrors) {
    write_body(id("name") + "=John");

    // no config file and no key
    EXPECT_EQ(run(std::string(GF_VALIDATE_BIN) + " -c /nonexistent/ghostfield.conf " + body).status, 1);
    // broken sigil name
    EXPECT_EQ(validate("-s 'bad sigil'").status, 1);
    // missing input file
    EXPECT_EQ(run(std::string(GF_VALIDATE_BIN) + common() + " /nonexistent/body").status, 1);
    // unknown option
    EXPECT_EQ(validate("--bogus").status, 1);
}

TEST_F(ToolTest, TimeOutsideCalendarIsAnError) {
    write_body(id("name") + "=John");
    std::string opts = std::string(" -c ") + conf + " -k secret --now 99999999999999999 --utc";

    ToolResult r = run(std::string(GF_VALIDATE_BIN) + opts + " " + body);
    EXPECT_EQ(r.status, 1);
    EXPECT_EQ(r.out, "");

    r = run(std::string(GF_RENDER_BIN) + opts + " --ids");
    EXPECT_NE(r.status, 0);
    EXPECT_EQ(r.out, "");
}
