#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#include "cli/commands.hpp"
#include "testing_utils.hpp"
#include "ulid/codec.hpp"

namespace {
constexpr char REFERENCE_ULID[] = "01ARYZ6S410000000000000000";

// Разбивает вывод на строки
std::vector<std::string> splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}
} // namespace

namespace ulidgen::tests {
using cli::CommandProcessor;
using cli::CommandResult;

class CommandsTest : public ::testing::Test {
protected:
    UlidGenerator generator { makeConstantProvider(1469918176.385), makeConstantProvider(0.0) };
    std::ostringstream out;

    CommandResult shot(std::vector<std::string> args, size_t count = 1)
    {
        return CommandProcessor::executeShot(generator, std::move(args), count, out);
    }
};

TEST_F(CommandsTest, GenerateUsesTimeProvider)
{
    EXPECT_EQ(CommandResult::SUCCESS, shot({ "generate" }));
    EXPECT_EQ(std::string(REFERENCE_ULID) + "\n", out.str());
}

TEST_F(CommandsTest, GenerateWithExplicitTime)
{
    EXPECT_EQ(CommandResult::SUCCESS, shot({ "generate", "0.001" }));
    EXPECT_EQ("00000000010000000000000000\n", out.str());
}

TEST_F(CommandsTest, GenerateCount)
{
    EXPECT_EQ(CommandResult::SUCCESS, shot({ "generate" }, 3));
    const auto lines = splitLines(out.str());
    ASSERT_EQ(3U, lines.size());
    for (const auto &line : lines) {
        EXPECT_EQ(REFERENCE_ULID, line);
    }
}

TEST_F(CommandsTest, TimeAndRandomFields)
{
    EXPECT_EQ(CommandResult::SUCCESS, shot({ "time" }));
    EXPECT_EQ(CommandResult::SUCCESS, shot({ "time", "1469918176.386", "12" }));
    EXPECT_EQ(CommandResult::SUCCESS, shot({ "random", "4" }));
    EXPECT_EQ(CommandResult::SUCCESS, shot({ "random" }));

    const auto lines = splitLines(out.str());
    ASSERT_EQ(4U, lines.size());
    EXPECT_EQ("01ARYZ6S41", lines[0]);
    EXPECT_EQ("0001ARYZ6S42", lines[1]);
    EXPECT_EQ("0000", lines[2]);
    EXPECT_EQ("0000000000000000", lines[3]);
}

// Ошибочные вызовы ничего не выводят
TEST_F(CommandsTest, InvalidUsage)
{
    const std::vector<std::vector<std::string>> invalidCalls = {
        {}, // нет команды
        { "uuid" }, // неизвестная команда
        { "generate", "now" }, // время не число
        { "generate", "1.5x" }, // лишние символы
        { "generate", "1", "2" }, // лишний аргумент
        { "generate", "-1" }, // отрицательное время
        { "time", "1", "abc" }, // длина не число
        { "time", "1", "-2" }, // отрицательная длина
        { "random", "100000" }, // слишком большая длина
        { "help" }, // только для интерактивного режима
        { "exit" } // только для интерактивного режима
    };
    for (const auto &args : invalidCalls) {
        EXPECT_EQ(CommandResult::FAILURE, shot(args));
    }
    EXPECT_TRUE(out.str().empty());
}

// Ошибка источника времени не приводит к выводу неполного идентификатора
TEST_F(CommandsTest, UnavailableTimeSourceFails)
{
    UlidGenerator broken(sources::unavailableTimeProvider(), makeConstantProvider(0.0));
    EXPECT_EQ(CommandResult::FAILURE,
              CommandProcessor::executeShot(broken, { "generate" }, 1, out));
    EXPECT_TRUE(out.str().empty());

    EXPECT_EQ(CommandResult::SUCCESS,
              CommandProcessor::executeShot(broken, { "generate", "1469918176.385" }, 1, out));
    EXPECT_EQ(std::string(REFERENCE_ULID) + "\n", out.str());
}

TEST_F(CommandsTest, InteractiveSession)
{
    std::istringstream in("generate\n"
                          "   \n"
                          "  time   0.001  \n"
                          "unknown\n"
                          "help\n"
                          "exit\n"
                          "generate\n");

    EXPECT_EQ(0, CommandProcessor::runInteractiveMode(generator, in, out));

    const auto output = out.str();
    EXPECT_NE(std::string::npos, output.find(REFERENCE_ULID));
    EXPECT_NE(std::string::npos, output.find("0000000001\n"));
    EXPECT_NE(std::string::npos, output.find("generate [ВРЕМЯ]"));
    // После exit команды не выполняются
    EXPECT_EQ(output.find(REFERENCE_ULID), output.rfind(REFERENCE_ULID));
}

// Конец ввода завершает интерактивный режим
TEST_F(CommandsTest, InteractiveEndOfInput)
{
    std::istringstream in("random 2\n");
    EXPECT_EQ(0, CommandProcessor::runInteractiveMode(generator, in, out));
    EXPECT_NE(std::string::npos, out.str().find("00\n"));
}

// Реальный генератор выдает корректные идентификаторы
TEST(CommandsDefaultGeneratorTest, GenerateFormatting)
{
    UlidGenerator generator;
    std::ostringstream out;
    EXPECT_EQ(CommandResult::SUCCESS,
              CommandProcessor::executeShot(generator, { "generate" }, 50, out));

    const auto lines = splitLines(out.str());
    ASSERT_EQ(50U, lines.size());
    for (const auto &line : lines) {
        EXPECT_EQ(ULID_LENGTH, line.size());
        EXPECT_TRUE(consistsOfAlphabet(line)) << line;
    }
}
} // namespace ulidgen::tests
