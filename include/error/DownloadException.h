#pragma once
#include <exception>
#include <string>

namespace RGET{

enum class ErrorKind
{
    Probe,      // 探测失败，整个下载终止
    Transfer,   // 传输中断，可重试
    Integrity,  // 本地文件损坏，删除后重下
    Cancelled   // 用户中断，保留已下载部分
};

class DownloadException : public std::exception {
public:
    DownloadException(ErrorKind kind, const std::string& msg, long code = 0)
        : kind_(kind), msg_(msg), code_(code) {}

    const char* what() const noexcept override { return msg_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    // curl 错误码或 HTTP 状态码，0 表示无
    long code() const noexcept { return code_; }

private:
    ErrorKind kind_;
    std::string msg_;
    long code_;
};

class ProbeError : public DownloadException {
public:
    explicit ProbeError(const std::string& msg, long code = 0)
        : DownloadException(ErrorKind::Probe, msg, code) {}
};

class TransferError : public DownloadException {
public:
    // httpStatus 非0表示服务器返回了错误状态码
    TransferError(const std::string& msg, long code = 0, long httpStatus = 0)
        : DownloadException(ErrorKind::Transfer, msg, code), httpStatus_(httpStatus) {}

    long httpStatus() const noexcept { return httpStatus_; }

private:
    long httpStatus_;
};

class IntegrityError : public DownloadException {
public:
    explicit IntegrityError(const std::string& msg, long code = 0)
        : DownloadException(ErrorKind::Integrity, msg, code) {}
};

class CancelledError : public DownloadException {
public:
    explicit CancelledError(const std::string& msg)
        : DownloadException(ErrorKind::Cancelled, msg) {}
};

const char* ErrorKindName(ErrorKind kind);

}
