#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Result<T>/Status буцаах утгын төрлүүд ба алдааны ангилал.
            Registry болон loader-ууд алдааг exception биш, утгаар буцаана.
*/


#include <cstdint>
#include <string>
#include <utility>

namespace qdr
{
    enum class ErrorKind : uint8_t
    {
        None = 0,
        // Configuration
        AlreadyRegistered = 1,
        // Lookup
        UnregisteredAsset = 2,
        UnregisteredLoader = 3,
        // Load
        LoadingError = 4,
        // Loader-side failures before they get wrapped by the registry
        InvalidSource = 5,
        DecodeFailed = 6,
        BackendFailure = 7
    };

    enum class ErrorCategory : uint8_t
    {
        None = 0,
        Configuration = 1,
        Lookup = 2,
        Load = 3
    };

    inline ErrorCategory error_category(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::None: return ErrorCategory::None;
            case ErrorKind::AlreadyRegistered: return ErrorCategory::Configuration;
            case ErrorKind::UnregisteredAsset:
            case ErrorKind::UnregisteredLoader: return ErrorCategory::Lookup;
            case ErrorKind::LoadingError:
            case ErrorKind::InvalidSource:
            case ErrorKind::DecodeFailed:
            case ErrorKind::BackendFailure: return ErrorCategory::Load;
        }
        return ErrorCategory::None;
    }

    inline const char* error_kind_name(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::None: return "none";
            case ErrorKind::AlreadyRegistered: return "already_registered";
            case ErrorKind::UnregisteredAsset: return "unregistered_asset";
            case ErrorKind::UnregisteredLoader: return "unregistered_loader";
            case ErrorKind::LoadingError: return "loading_error";
            case ErrorKind::InvalidSource: return "invalid_source";
            case ErrorKind::DecodeFailed: return "decode_failed";
            case ErrorKind::BackendFailure: return "backend_failure";
        }
        return "unknown";
    }

    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};
        ErrorKind kind = ErrorKind::None;

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}, ErrorKind::None};
        }

        static Result<T> failure(ErrorKind k, std::string e)
        {
            return Result<T>{false, T{}, std::move(e), k};
        }

        explicit operator bool() const { return ok; }
    };

    struct Status
    {
        bool ok = false;
        std::string error{};
        ErrorKind kind = ErrorKind::None;

        static Status success()
        {
            return Status{true, {}, ErrorKind::None};
        }

        static Status failure(ErrorKind k, std::string e)
        {
            return Status{false, std::move(e), k};
        }

        explicit operator bool() const { return ok; }
    };
}
