#include <sys/stat.h>
#include <zip.h>
#include "gtest/gtest.h"
#include "project/packager.hpp"

using namespace std;
using namespace grader;

/**
 * @brief 通过 libzip 读出压缩包中的所有文件
 */
struct zip_reader {
    explicit zip_reader(const string &bytes) {
        zip_error_t error;
        zip_error_init(&error);
        zip_source_t *source = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &error);
        if (source) {
            archive = zip_open_from_source(source, ZIP_RDONLY, &error);
            if (!archive) zip_source_free(source);
        }
        zip_error_fini(&error);
    }

    ~zip_reader() {
        if (archive) zip_discard(archive);
    }

    zip_int64_t entries() const {
        return zip_get_num_entries(archive, 0);
    }

    string name(zip_uint64_t index) const {
        return zip_get_name(archive, index, 0);
    }

    string content(zip_uint64_t index) const {
        zip_stat_t st;
        zip_stat_index(archive, index, 0, &st);
        string data(st.size, '\0');
        zip_file_t *file = zip_fopen_index(archive, index, 0);
        zip_fread(file, data.data(), st.size);
        zip_fclose(file);
        return data;
    }

    zip_stat_t stat(zip_uint64_t index) const {
        zip_stat_t st;
        zip_stat_index(archive, index, 0, &st);
        return st;
    }

    zip_uint32_t attributes(zip_uint64_t index) const {
        zip_uint8_t opsys = 0;
        zip_uint32_t attrs = 0;
        zip_file_get_external_attributes(archive, index, 0, &opsys, &attrs);
        return attrs;
    }

    zip_t *archive = nullptr;
};

class PackagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        proj.files.emplace_back("main.adb", "procedure Main is\nbegin\n   null;\nend Main;\n");
        proj.files.emplace_back("helper.c", string(4096, 'x'));
        proj.files.emplace_back("main.gpr", "project Main is\nend Main;\n", language::MANIFEST);
        proj.files.emplace_back("main.adc", "pragma SPARK_Mode (On);\n", language::CONFIG);
    }

    project proj;
};

TEST_F(PackagerTest, ContainsAllFilesInOrder) {
    string bytes = grader::zip(proj);
    zip_reader reader(bytes);
    ASSERT_NE(reader.archive, nullptr);
    ASSERT_EQ(reader.entries(), 4);
    for (zip_uint64_t i = 0; i < 4; ++i) {
        EXPECT_EQ(reader.name(i), proj.files[i].name());
        EXPECT_EQ(reader.content(i), proj.files[i].content());
    }
}

TEST_F(PackagerTest, FixedMetadata) {
    string bytes = grader::zip(proj);
    zip_reader reader(bytes);
    ASSERT_NE(reader.archive, nullptr);
    for (zip_uint64_t i = 0; i < 4; ++i) {
        zip_stat_t st = reader.stat(i);
        EXPECT_EQ(st.comp_method, ZIP_CM_DEFLATE);
        EXPECT_EQ(reader.attributes(i) >> 16, static_cast<zip_uint32_t>(S_IFREG | 0644));
    }
    // 重复的内容应该被压缩
    EXPECT_LT(reader.stat(1).comp_size, reader.stat(1).size);
}

TEST_F(PackagerTest, Deterministic) {
    string first = grader::zip(proj);
    string second = grader::zip(proj);
    EXPECT_EQ(first, second);
}
