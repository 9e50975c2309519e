#pragma once
#include <QtGlobal>

enum class ReplyShape : quint8 {
    Generate, Chat
};

enum class FrameKind : quint8 {
    Opening, Content, Final
};

enum class ErrorKind : quint8 {
    InvalidInput,     // 400
    NotFound,         // 404
    UpstreamHttp,     // upstream status, passed through
    Parse,            // 500
    StreamTransport,  // in-band only once headers are out
    Timeout,          // 504
    Internal          // 500
};

enum class StreamState : quint8 {
    AwaitingFirst, Streaming, Terminated
};
