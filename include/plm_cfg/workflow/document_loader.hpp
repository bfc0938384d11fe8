#pragma once

#include <plm_cfg/core/result.hpp>
#include <plm_cfg/plmxml/plmxml_document.hpp>

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace plm_cfg {

using DocumentPtr = std::shared_ptr<const PlmXmlDocument>;
using DocumentLoadResult = Result<DocumentPtr, Error>;

// ---------------------------------------------------------------------------
// DocumentLoader: parses a PLM-XML file on a background thread.
//
// The document is published exactly once, fully built: Wait() blocks until
// parsing has finished and the optional callback runs on the worker thread
// after the result is set. Nothing of a partially parsed document is ever
// visible to the caller.
// ---------------------------------------------------------------------------
class DocumentLoader {
public:
    using Callback = std::function<void(const DocumentLoadResult&)>;

    explicit DocumentLoader(std::string path);
    ~DocumentLoader();

    DocumentLoader(const DocumentLoader&) = delete;
    DocumentLoader& operator=(const DocumentLoader&) = delete;

    // Returns false if already started.
    bool Start(Callback on_complete = {});

    [[nodiscard]] bool IsDone() const noexcept { return done_; }

    // Blocks until the document is available. Must be called after Start().
    [[nodiscard]] const DocumentLoadResult& Wait() const;

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

private:
    void Run();

    std::string path_;
    Callback callback_;
    std::promise<DocumentLoadResult> promise_;
    std::shared_future<DocumentLoadResult> future_;
    std::thread thread_;
    std::atomic<bool> started_{false};
    std::atomic<bool> done_{false};
};

} // namespace plm_cfg
