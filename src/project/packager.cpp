#include "project/packager.hpp"
#include <glog/logging.h>
#include <sys/stat.h>
#include <zip.h>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

// DOS 时间格式：日期 1980-01-01，时间 00:00:00
static const zip_uint16_t FIXED_DOS_DATE = (0 << 9) | (1 << 5) | 1;
static const zip_uint16_t FIXED_DOS_TIME = 0;
static const mode_t FILE_MODE = 0644;

/**
 * @brief 持有一个 zip_source_t 的引用计数
 */
struct zip_source_guard {
    zip_source_t *source;

    explicit zip_source_guard(zip_source_t *source) : source(source) {}
    zip_source_guard(const zip_source_guard &) = delete;
    zip_source_guard &operator=(const zip_source_guard &) = delete;

    ~zip_source_guard() {
        if (source) zip_source_free(source);
    }
};

static internal_error zip_exception(const string &function, zip_error_t *error) {
    return internal_error(function + "() - " + zip_error_strerror(error));
}

static void add_file(zip_t *archive, const source_file &file) {
    zip_source_t *data = zip_source_buffer(archive, file.content().data(), file.content().size(), 0);
    if (!data)
        throw internal_error("zip_source_buffer() - " + string(zip_strerror(archive)));

    zip_int64_t index = zip_file_add(archive, file.name().c_str(), data, ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
    if (index < 0) {
        zip_source_free(data);
        throw internal_error("zip_file_add() - " + string(zip_strerror(archive)));
    }

    zip_uint64_t idx = static_cast<zip_uint64_t>(index);
    if (zip_set_file_compression(archive, idx, ZIP_CM_DEFLATE, 0) < 0)
        throw internal_error("zip_set_file_compression() - " + string(zip_strerror(archive)));
    if (zip_file_set_dostime(archive, idx, FIXED_DOS_TIME, FIXED_DOS_DATE, 0) < 0)
        throw internal_error("zip_file_set_dostime() - " + string(zip_strerror(archive)));
    if (zip_file_set_external_attributes(archive, idx, 0, ZIP_OPSYS_UNIX, (S_IFREG | FILE_MODE) << 16) < 0)
        throw internal_error("zip_file_set_external_attributes() - " + string(zip_strerror(archive)));
}

static string read_source(zip_source_t *source) {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_source_stat(source, &st) < 0)
        throw zip_exception("zip_source_stat", zip_source_error(source));

    if (zip_source_open(source) < 0)
        throw zip_exception("zip_source_open", zip_source_error(source));

    string bytes(st.size, '\0');
    zip_int64_t n = zip_source_read(source, bytes.data(), st.size);
    zip_source_close(source);
    if (n < 0 || static_cast<zip_uint64_t>(n) != st.size)
        throw zip_exception("zip_source_read", zip_source_error(source));
    return bytes;
}

string zip(const project &proj) {
    zip_error_t error;
    zip_error_init(&error);

    // 压缩包写入内存中的 buffer，zip_close 之后再从 buffer 中读出
    zip_source_guard buffer(zip_source_buffer_create(nullptr, 0, 0, &error));
    if (!buffer.source) {
        internal_error ex = zip_exception("zip_source_buffer_create", &error);
        zip_error_fini(&error);
        throw ex;
    }

    zip_t *archive = zip_open_from_source(buffer.source, ZIP_TRUNCATE, &error);
    if (!archive) {
        internal_error ex = zip_exception("zip_open_from_source", &error);
        zip_error_fini(&error);
        throw ex;
    }
    zip_error_fini(&error);
    // zip_close 和 zip_discard 会释放 buffer，保留一个引用以便读出压缩包
    zip_source_keep(buffer.source);

    try {
        for (auto &file : proj.files)
            add_file(archive, file);
    } catch (internal_error &) {
        zip_discard(archive);
        throw;
    }

    if (zip_close(archive) < 0) {
        string message = zip_strerror(archive);
        zip_discard(archive);
        throw internal_error("zip_close() - " + message);
    }

    string bytes = read_source(buffer.source);
    DLOG(INFO) << "Packed " << proj.files.size() << " files into " << bytes.size() << " bytes";
    return bytes;
}

}  // namespace grader
