#include <plm_cfg/workflow/document_loader.hpp>

#include <plm_cfg/core/log.hpp>

#include <exception>

namespace plm_cfg {

DocumentLoader::DocumentLoader(std::string path)
    : path_(std::move(path)), future_(promise_.get_future().share()) {}

DocumentLoader::~DocumentLoader() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool DocumentLoader::Start(Callback on_complete) {
    if (started_.exchange(true)) {
        return false;
    }
    callback_ = std::move(on_complete);
    thread_ = std::thread(&DocumentLoader::Run, this);
    return true;
}

const DocumentLoadResult& DocumentLoader::Wait() const {
    return future_.get();
}

void DocumentLoader::Run() {
    LogDebug(log_component::kPlmXml, "Loading " + path_ + " in background");
    auto result = [this]() -> DocumentLoadResult {
        try {
            auto parsed = PlmXmlDocument::FromFile(path_);
            if (parsed.IsErr()) {
                return DocumentLoadResult::Err(std::move(parsed).Error());
            }
            return DocumentLoadResult::Ok(
                std::make_shared<const PlmXmlDocument>(std::move(parsed).Value()));
        } catch (const std::exception& e) {
            return DocumentLoadResult::Err(Error{
                "LoadDocument", path_, std::nullopt,
                std::string("Unexpected failure while parsing: ") + e.what(),
                std::nullopt, ErrorCategory::Internal});
        }
    }();

    // Set before publishing so IsDone() holds as soon as Wait() returns.
    done_ = true;
    promise_.set_value(std::move(result));
    if (callback_) {
        callback_(future_.get());
    }
}

} // namespace plm_cfg
