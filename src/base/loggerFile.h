#ifndef XMPRES_LOGGERFILE_H
#define XMPRES_LOGGERFILE_H

#include "logger.h"
#include <stdexcept>
#include <string.h>

namespace xmpres
{
/** Appends log lines to a file. When the file grows past the rotate size, its
 * older half is dropped, cutting at a line boundary where possible.
 * Not thread safe, the Logger serializes access */
class FileLogger
{
protected:
    std::string mFileName;
    size_t mRotateSize;
    FILE* mFile = nullptr;
    size_t mSize = 0;

    void open(const char* mode)
    {
        mFile = fopen(mFileName.c_str(), mode);
        if (!mFile)
            throw std::runtime_error("FileLogger: Can't open log file "+mFileName);
        fseek(mFile, 0, SEEK_END);
        long pos = ftell(mFile);
        mSize = (pos > 0) ? static_cast<size_t>(pos) : 0;
    }
    void close()
    {
        if (!mFile)
            return;
        fclose(mFile);
        mFile = nullptr;
    }
    std::string readAll()
    {
        std::string data(mSize, '\0');
        fseek(mFile, 0, SEEK_SET);
        size_t read = fread(&data[0], 1, mSize, mFile);
        fseek(mFile, 0, SEEK_END);
        data.resize(read);
        return data;
    }

public:
    FileLogger(const char* fileName, size_t rotateSize)
    : mFileName(fileName), mRotateSize(rotateSize)
    {
        if (!rotateSize)
            throw std::invalid_argument("FileLogger: rotate size must be non-zero");
        open("ab+");
    }
    ~FileLogger() { close(); }
    size_t size() const { return mSize; }

    void write(const char* msg, size_t len, bool flush)
    {
        if (mSize >= mRotateSize)
            rotate();
        size_t written = fwrite(msg, 1, len, mFile);
        mSize += written;
        if (written != len)
            fprintf(stderr, "FileLogger: Error writing to %s\n", mFileName.c_str());
        if (flush)
            fflush(mFile);
    }

    void rotate()
    {
        fflush(mFile);
        auto data = readAll();
        size_t keepFrom = (data.size() > mRotateSize / 2) ? data.size() - mRotateSize / 2 : 0;
        auto nl = data.find('\n', keepFrom);
        if (nl != std::string::npos)
            keepFrom = nl + 1;

        close();
        open("wb");
        size_t keepLen = data.size() - keepFrom;
        if (fwrite(data.data() + keepFrom, 1, keepLen, mFile) != keepLen)
            fprintf(stderr, "FileLogger: Error rewriting %s during rotation\n", mFileName.c_str());
        close();
        open("ab+");
    }
};
}
#endif
