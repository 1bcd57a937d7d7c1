// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------
#include <stddef.h>
#include <stdint.h>

#include <sstream>
#include <stdexcept>
#include <streambuf>  // NOLINT
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/Size.h"
#include "data/BufferPool.h"
#include "data/Chunk.h"
#include "data/ChunkReader.h"

namespace {

using QSPipe::Data::BufferPool;
using QSPipe::Data::Chunk;
using QSPipe::Data::ChunkReader;
using QSPipe::Exception::ConfigError;
using QSPipe::Exception::InputError;
using QSPipe::Size::MB1;
using QSPipe::Size::MB5;
using std::istringstream;
using std::string;

// Input of given size with a recognizable byte pattern
string MakeInput(size_t size) {
  string input(size, '\0');
  for (size_t i = 0; i < size; ++i) {
    input[i] = static_cast<char>('a' + i % 26);
  }
  return input;
}

// Read all chunks, releasing each buffer after use, and return the bytes
string ReadAll(ChunkReader *reader, BufferPool *pool,
               std::vector<size_t> *lengths) {
  string output;
  Chunk chunk;
  int expectedPart = 1;
  while (reader->Next(&chunk)) {
    EXPECT_EQ(chunk.GetPartNumber(), expectedPart++);
    EXPECT_FALSE(chunk.IsEmpty());
    output.append(&(*chunk.GetBuffer())[0], chunk.GetLength());
    lengths->push_back(chunk.GetLength());
    pool->Release(chunk.GetBuffer());
  }
  return output;
}

// A stream buffer failing after handing out some bytes
class FailingStreamBuf : public std::streambuf {
 public:
  explicit FailingStreamBuf(const string &data) : m_data(data) {
    setg(&m_data[0], &m_data[0], &m_data[0] + m_data.size());
  }

 protected:
  int_type underflow() { throw std::runtime_error("device error"); }

 private:
  string m_data;
};

}  // namespace

TEST(ChunkReaderTest, ZeroPartSize) {
  BufferPool pool(1, 1);
  istringstream input("x");
  EXPECT_THROW(ChunkReader(input, 1, 0, pool), ConfigError);
}

TEST(ChunkReaderTest, BufferSize) {
  EXPECT_EQ(ChunkReader::GetBufferSize(1, MB5), 1u);
  EXPECT_EQ(ChunkReader::GetBufferSize(10 * MB1, MB5), MB5);
  EXPECT_EQ(ChunkReader::GetBufferSize(MB5, MB5), MB5);
}

TEST(ChunkReaderTest, OneByte) {
  string data = MakeInput(1);
  istringstream input(data);
  BufferPool pool(1, ChunkReader::GetBufferSize(1, MB5));
  ChunkReader reader(input, 1, MB5, pool);

  std::vector<size_t> lengths;
  EXPECT_EQ(ReadAll(&reader, &pool, &lengths), data);
  ASSERT_EQ(lengths.size(), 1u);
  EXPECT_EQ(lengths[0], 1u);
  EXPECT_EQ(reader.GetChunkCount(), 1);
  EXPECT_EQ(reader.GetBytesRead(), 1u);
  EXPECT_FALSE(reader.HasNext());
}

TEST(ChunkReaderTest, ExactMultiple) {
  uint64_t size = 10 * MB1;
  string data = MakeInput(size);
  istringstream input(data);
  BufferPool pool(1, ChunkReader::GetBufferSize(size, MB5));
  ChunkReader reader(input, size, MB5, pool);

  std::vector<size_t> lengths;
  EXPECT_EQ(ReadAll(&reader, &pool, &lengths), data);
  ASSERT_EQ(lengths.size(), 2u);
  EXPECT_EQ(lengths[0], MB5);
  EXPECT_EQ(lengths[1], MB5);
  EXPECT_EQ(pool.GetAllocatedCount(), 1u);
}

TEST(ChunkReaderTest, ShortLastChunk) {
  uint64_t size = 11 * MB1;
  string data = MakeInput(size);
  istringstream input(data);
  BufferPool pool(2, ChunkReader::GetBufferSize(size, MB5));
  ChunkReader reader(input, size, MB5, pool);

  std::vector<size_t> lengths;
  EXPECT_EQ(ReadAll(&reader, &pool, &lengths), data);
  ASSERT_EQ(lengths.size(), 3u);
  EXPECT_EQ(lengths[0], MB5);
  EXPECT_EQ(lengths[1], MB5);
  EXPECT_EQ(lengths[2], MB1);
  EXPECT_EQ(reader.GetChunkCount(), 3);
  EXPECT_EQ(reader.GetBytesRead(), size);
}

TEST(ChunkReaderTest, ExcessBytesIgnored) {
  istringstream input("0123456789ABC");
  BufferPool pool(1, 4);
  ChunkReader reader(input, 10, 4, pool);

  std::vector<size_t> lengths;
  EXPECT_EQ(ReadAll(&reader, &pool, &lengths), string("0123456789"));
  ASSERT_EQ(lengths.size(), 3u);
  EXPECT_EQ(lengths[2], 2u);
  // nothing beyond the declared size is consumed
  EXPECT_EQ(input.get(), 'A');
}

TEST(ChunkReaderTest, TruncatedInput) {
  uint64_t size = 10 * MB1;
  string data = MakeInput(8 * MB1);
  istringstream input(data);
  BufferPool pool(2, ChunkReader::GetBufferSize(size, MB5));
  ChunkReader reader(input, size, MB5, pool);

  Chunk chunk;
  ASSERT_TRUE(reader.Next(&chunk));
  EXPECT_EQ(chunk.GetLength(), MB5);
  pool.Release(chunk.GetBuffer());

  try {
    reader.Next(&chunk);
    FAIL() << "InputError is not thrown";
  } catch (const InputError &err) {
    EXPECT_EQ(err.get(), string("Input truncated: expect 10485760 bytes but "
                                "got only 8388608 bytes"));
  }
  // buffer of the failed chunk is back in the pool
  EXPECT_EQ(pool.GetInUseCount(), 0u);
  EXPECT_EQ(pool.ShutdownAndWait(), 1u);
}

TEST(ChunkReaderTest, EmptyInput) {
  istringstream input("");
  BufferPool pool(1, 4);
  ChunkReader reader(input, 4, 4, pool);
  Chunk chunk;
  EXPECT_THROW(reader.Next(&chunk), InputError);
  EXPECT_EQ(pool.GetInUseCount(), 0u);
}

TEST(ChunkReaderTest, ReadFailure) {
  FailingStreamBuf failing("0123");
  std::istream input(&failing);
  BufferPool pool(1, 8);
  ChunkReader reader(input, 8, 8, pool);

  Chunk chunk;
  try {
    reader.Next(&chunk);
    FAIL() << "InputError is not thrown";
  } catch (const InputError &err) {
    // not reported as truncated, the stream did not reach its end
    EXPECT_EQ(err.get().find("Fail to read input at offset"), 0u);
  }
  EXPECT_EQ(pool.GetInUseCount(), 0u);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
