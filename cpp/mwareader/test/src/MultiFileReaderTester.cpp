#include "mwareader/test/MultiFileReaderTester.hpp"

#include "mwareader/Errors.hpp"

#include <algorithm>

namespace mwareader
{
namespace test
{

MultiFileReaderTester::MultiFileReaderTester(): ::testing::Test()
{
}

MultiFileReaderTester::~MultiFileReaderTester()
{
}

void MultiFileReaderTester::SetUp()
{
}

void MultiFileReaderTester::TearDown()
{
}

TEST_F(MultiFileReaderTester, test_read_across_files)
{
    // Each file is a 4 byte header followed by 10 data bytes
    std::vector<std::string> files;
    std::vector<std::int8_t> expected;
    for(int ii = 0; ii < 3; ++ii) {
        auto const data = make_voltages(10, ii * 10);
        expected.insert(expected.end(), data.begin(), data.end());
        files.push_back(_dir.file("file" + std::to_string(ii) + ".dat"));
        write_sparse_file(files.back(), 14, "HDR!", {{4, data}});
    }

    MultiFileReader reader(files, 4, 10);
    ASSERT_EQ(reader.total_size(), 30u);
    reader.seekg(7);
    ASSERT_EQ(reader.tellg(), 7u);
    std::vector<std::int8_t> buffer(16);
    reader.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
    ASSERT_TRUE(std::equal(buffer.begin(), buffer.end(),
                           expected.begin() + 7));
    ASSERT_EQ(reader.tellg(), 23u);
    ASSERT_TRUE(reader.can_read(7));
    ASSERT_FALSE(reader.can_read(8));
}

TEST_F(MultiFileReaderTester, test_read_past_end)
{
    std::string const path = _dir.file("short.dat");
    write_sparse_file(path, 10, "", {});
    MultiFileReader reader({path}, 0, 10);
    std::vector<char> buffer(11);
    try {
        reader.read(buffer.data(), buffer.size());
        FAIL() << "Expected a DataError";
    } catch(DataError const& error) {
        ASSERT_EQ(error.kind(), DataError::Kind::ShortRead);
    }
    ASSERT_THROW(reader.seekg(11), DataError);
}

TEST_F(MultiFileReaderTester, test_truncated_file)
{
    // The file is shorter than the data size it claims to hold
    std::string const path = _dir.file("truncated.dat");
    write_sparse_file(path, 6, "", {});
    MultiFileReader reader({path}, 0, 10);
    std::vector<char> buffer(10);
    try {
        reader.read(buffer.data(), buffer.size());
        FAIL() << "Expected a DataError";
    } catch(DataError const& error) {
        ASSERT_EQ(error.kind(), DataError::Kind::ShortRead);
    }
}

TEST_F(MultiFileReaderTester, test_missing_file)
{
    MultiFileReader reader({_dir.file("absent.dat")}, 0, 10);
    std::vector<char> buffer(4);
    try {
        reader.read(buffer.data(), buffer.size());
        FAIL() << "Expected a DataError";
    } catch(DataError const& error) {
        ASSERT_EQ(error.kind(), DataError::Kind::FileAccess);
    }
}

} // namespace test
} // namespace mwareader
