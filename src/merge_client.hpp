#pragma once
#include <string>
#include "strokes.hpp"

struct HttpResult { int code; std::string body; };

struct UploadInfo {
    std::string image_id;
    int width = 0;
    int height = 0;
};

// Client of the corridor merge server: stores the base image and bakes an
// exported corridor into it.
class MergeClient {
public:
    explicit MergeClient(std::string server_base);
    // POST /upload, multipart field "file".
    HttpResult upload_image(const std::string& file_path);
    // POST /merge with the JSON export payload; a 2xx body is the PNG.
    HttpResult merge(const ExportPayload& payload);
private:
    std::string base_;
};

bool parse_upload_response(const std::string& body, UploadInfo& out);
// "error" field of a JSON failure body, or the raw body when it is not JSON.
std::string extract_error(const std::string& body);
