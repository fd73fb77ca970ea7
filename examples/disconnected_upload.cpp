/**
 * @file disconnected_upload.cpp
 * @brief Upload a stream with metadata handed out by an earlier command
 *
 * This example demonstrates:
 * - Obtaining file_transfer_metadata from a PUT agent
 * - Dropping the session and uploading later from an input stream
 * - Reading the single result row of a disconnected upload
 */

#include <kcenon/stage_transfer/stage_transfer.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace kcenon::stage_transfer;

namespace {

/**
 * @brief Stage session answering every request with one LOCAL_FS stage
 */
class local_stage_session : public stage_session {
public:
    explicit local_stage_session(std::filesystem::path root) : root_(std::move(root)) {}

    auto describe_stage(const stage_request& /*request*/) -> result<std::string> override {
        return R"({"locationType":"LOCAL_FS","location":")" + root_.string() + R"(/"})";
    }

private:
    std::filesystem::path root_;
};

}  // namespace

int main(int argc, char* argv[]) {
    const std::filesystem::path stage_dir =
        argc > 1 ? std::filesystem::path(argv[1])
                 : std::filesystem::temp_directory_path() / "stage_transfer_disconnected";
    std::filesystem::create_directories(stage_dir);

    std::vector<file_transfer_metadata> metadatas;
    {
        // The session only lives long enough to resolve the stage
        transfer_context context;
        context.session_handle = std::make_shared<local_stage_session>(stage_dir);

        auto agent = transfer_agent::create("PUT file:///tmp/events_*.json @events/incoming",
                                            std::move(context));
        if (!agent) {
            std::cerr << "Failed to create agent: " << describe(agent.error()) << std::endl;
            return 1;
        }

        auto handed_out = agent.value()->file_transfer_metadatas();
        if (!handed_out) {
            std::cerr << "No metadata: " << describe(handed_out.error()) << std::endl;
            return 1;
        }
        metadatas = std::move(handed_out.value());
    }

    std::cout << "Received " << metadatas.size() << " metadata object(s)" << std::endl;

    for (int batch = 0; batch < 3; ++batch) {
        auto stream = std::make_shared<std::stringstream>();
        for (int event = 0; event < 100; ++event) {
            *stream << R"({"batch":)" << batch << R"(,"event":)" << event << "}\n";
        }

        auto config = upload_config::builder()
                          .with_metadata(metadatas.front())
                          .with_input_stream(stream)
                          .with_destination_filename("events_" + std::to_string(batch) + ".json")
                          .with_require_compress(true)
                          .with_ingest_client_name("example-ingest")
                          .build();
        if (!config) {
            std::cerr << "Invalid upload config: " << describe(config.error()) << std::endl;
            return 1;
        }

        auto row = upload_without_connection(config.value());
        if (!row) {
            std::cerr << "Upload failed: " << describe(row.error()) << std::endl;
            return 1;
        }

        std::cout << "Uploaded " << row.value().target << " (" << row.value().destination_size
                  << " bytes)" << std::endl;
    }

    return 0;
}
