#include "merge_client.hpp"
#include "export.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <utility>
extern "C" {
#include <json-c/json.h>
}

static size_t wr(void* c, size_t s, size_t n, void* u) {
    ((std::string*)u)->append((char*)c, s*n); return s*n;
}

MergeClient::MergeClient(std::string server_base): base_(std::move(server_base)) {}

static HttpResult perform(CURL* h, curl_slist* hdrs){
    std::string resp; long code=0;
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, wr);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp);
    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) return {0, curl_easy_strerror(rc)};
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    return {(int)code, resp};
}

HttpResult MergeClient::upload_image(const std::string& file_path){
    CURL* h = curl_easy_init();
    if (!h) throw std::runtime_error("curl init fail");
    curl_slist* hdrs = curl_slist_append(nullptr, "User-Agent: corridortrace");

    curl_mime* form = curl_mime_init(h);
    curl_mimepart* part = curl_mime_addpart(form);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, file_path.c_str());

    std::string url = base_ + "/upload";
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_MIMEPOST, form);
    HttpResult r = perform(h, hdrs);

    curl_mime_free(form);
    curl_slist_free_all(hdrs);
    curl_easy_cleanup(h);
    return r;
}

HttpResult MergeClient::merge(const ExportPayload& payload){
    CURL* h = curl_easy_init();
    if (!h) throw std::runtime_error("curl init fail");
    curl_slist* hdrs = nullptr;
    hdrs = curl_slist_append(hdrs, "User-Agent: corridortrace");
    hdrs = curl_slist_append(hdrs, "Content-Type: application/json");

    std::string url = base_ + "/merge";
    std::string body = payload_to_json(payload);
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, (long)body.size());
    HttpResult r = perform(h, hdrs);

    curl_slist_free_all(hdrs);
    curl_easy_cleanup(h);
    return r;
}

bool parse_upload_response(const std::string& body, UploadInfo& out){
    json_object* root = json_tokener_parse(body.c_str());
    if (!root) return false;
    json_object* jid=nullptr; json_object* jw=nullptr; json_object* jh=nullptr;
    bool ok = json_object_object_get_ex(root,"image_id",&jid) &&
              json_object_object_get_ex(root,"width",&jw) &&
              json_object_object_get_ex(root,"height",&jh);
    if (ok){
        const char* id = json_object_get_string(jid);
        out.image_id = id ? id : "";
        out.width = json_object_get_int(jw);
        out.height = json_object_get_int(jh);
        ok = !out.image_id.empty() && out.width > 0 && out.height > 0;
    }
    json_object_put(root);
    return ok;
}

std::string extract_error(const std::string& body){
    json_object* root = json_tokener_parse(body.c_str());
    if (!root) return body;
    std::string msg = body;
    json_object* jerr=nullptr;
    if (json_object_object_get_ex(root,"error",&jerr)){
        const char* t = json_object_get_string(jerr);
        if (t) msg = t;
    }
    json_object_put(root);
    return msg;
}
