#pragma once
#include <cstdint>

// Branch prediction hints for hot-path optimization
#ifndef MCSLB_LIKELY
#define MCSLB_LIKELY(x)   __builtin_expect(!!(x), 1)
#endif
#ifndef MCSLB_UNLIKELY
#define MCSLB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif

class io_handler
{
public:
    virtual ~io_handler() = default;
    virtual void on_cqe(struct io_uring_cqe* cqe) = 0;
};

enum op_type : uint8_t
{
    op_accept           = 0,
    op_read             = 1,
    op_multishot_accept = 2,
    op_timeout          = 3
};

struct io_request
{
    io_handler* owner;
    char* buffer;
    int fd;
    uint32_t length;
    op_type type;
};
