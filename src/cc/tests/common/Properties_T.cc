#include <gtest/gtest.h>

#include "common/Properties.h"
#include "tests/rbstest.h"

#include <sstream>
#include <string>

using std::istringstream;
using std::string;
using RBS::Properties;
using RBS::Test::RBSTestUtils;

TEST(LoadPropertiesTest, LoadFromFile) {
	string confStr = "# writer settings\n";
	confStr       += "rbs.writer.stream.bufferSize = 65536\n";
	confStr       += "   rbs.writer.checksum.type=SHA256   \n";
	confStr       += "no delimiter line\n";
	confStr       += "  # indented comment = ignored\n";

	string filePath = RBSTestUtils::WriteTempFile(confStr);
	Properties p;
	ASSERT_EQ(0, p.loadProperties(filePath.c_str(), '='));
	ASSERT_EQ(2u, p.size());
	ASSERT_EQ(65536, p.getValue("rbs.writer.stream.bufferSize", 0));
	ASSERT_STREQ("SHA256", p.getValue("rbs.writer.checksum.type", ""));
	ASSERT_TRUE(p.getValue("indented comment") == 0);

	RBSTestUtils::RemoveForcefully(filePath);
}

TEST(LoadPropertiesTest, MissingFile) {
	Properties p;
	ASSERT_GT(0, p.loadProperties("/nonexistent/rbs.prp", '='));
	ASSERT_TRUE(p.empty());
}

TEST(LoadPropertiesTest, LoadFromBufferAndStream) {
	const string buf = "a=1\nb = two\n";
	Properties p;
	ASSERT_EQ(0, p.loadProperties(buf.data(), buf.size(), '='));
	ASSERT_EQ(1, p.getValue("a", 0));
	ASSERT_EQ(string("two"), p.getValue("b", string()));

	istringstream in("c: 3\n");
	ASSERT_EQ(0, p.loadProperties(in, ':'));
	ASSERT_EQ(3L, p.getValue("c", 0L));
	ASSERT_EQ(3u, p.size());
}

TEST(PropertiesTest, TypedValues) {
	Properties p;
	p.setValue("int", "42");
	p.setValue("neg", "-7");
	p.setValue("big", "17179869184");
	p.setValue("dbl", "0.25");
	p.setValue("bad", "12abc");

	ASSERT_EQ(42, p.getValue("int", 0));
	ASSERT_EQ(-7, p.getValue("neg", 0));
	ASSERT_EQ(17179869184LL, p.getValue("big", 0LL));
	ASSERT_EQ((unsigned long long)17179869184LL,
		p.getValue("big", (unsigned long long)0));
	ASSERT_DOUBLE_EQ(0.25, p.getValue("dbl", 0.0));
	ASSERT_EQ(5, p.getValue("bad", 5));
	ASSERT_EQ(9, p.getValue("missing", 9));
}

TEST(PropertiesTest, HexWithBaseZero) {
	Properties p(0);
	p.setValue("mask", "0x100");
	ASSERT_EQ(256, p.getValue("mask", 0));
	p.setIntBase(10);
	ASSERT_EQ(1, p.getValue("mask", 1));
}

TEST(PropertiesTest, RemoveCopyWithPrefixAndList) {
	Properties p;
	p.setValue("rbs.writer.opTimeoutMs", "100");
	p.setValue("rbs.writer.watchTimeoutMs", "200");
	p.setValue("rbs.log.logLevel", "DEBUG");

	Properties writer;
	ASSERT_EQ(2u, p.copyWithPrefix("rbs.writer.", writer));
	ASSERT_EQ(2u, writer.size());
	ASSERT_EQ(100, writer.getValue("rbs.writer.opTimeoutMs", 0));

	ASSERT_TRUE(p.remove("rbs.log.logLevel"));
	ASSERT_FALSE(p.remove("rbs.log.logLevel"));

	string list;
	p.getList(list, "> ");
	ASSERT_EQ(string(
		"> rbs.writer.opTimeoutMs=100\n"
		"> rbs.writer.watchTimeoutMs=200\n"), list);
}
