#include "bind_forward.hpp"
#include <spendguard/spendguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

using namespace spendguard;
using namespace spendguard::provider;

// Trampoline class to allow Python inference backends
class PyInferenceClient : public InferenceClient {
public:
    using InferenceClient::InferenceClient;

    InferenceResult stream_completion(const InferenceRequest& request,
                                      const TokenCallback& on_token) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(InferenceResult, InferenceClient, stream_completion,
                               request, on_token);
    }
};

void bind_provider(py::module_& m) {
    auto provider_mod = m.def_submodule("provider", "Inference provider seam");

    // ---- Enums --------------------------------------------------------------
    py::enum_<ProviderErrorKind>(provider_mod, "ProviderErrorKind")
        .value("ContextLength",  ProviderErrorKind::ContextLength)
        .value("RateLimited",    ProviderErrorKind::RateLimited)
        .value("Authentication", ProviderErrorKind::Authentication)
        .value("InvalidRequest", ProviderErrorKind::InvalidRequest)
        .value("Upstream",       ProviderErrorKind::Upstream)
        .value("Aborted",        ProviderErrorKind::Aborted)
        .export_values();

    // ---- Messages and results -----------------------------------------------
    py::class_<ChatMessage>(provider_mod, "ChatMessage")
        .def(py::init<>())
        .def(py::init([](std::string role, std::string content) {
                 return ChatMessage{std::move(role), std::move(content)};
             }),
             py::arg("role"), py::arg("content"))
        .def_readwrite("role",    &ChatMessage::role)
        .def_readwrite("content", &ChatMessage::content);

    py::class_<InferenceRequest>(provider_mod, "InferenceRequest")
        .def(py::init<>())
        .def_readwrite("model",      &InferenceRequest::model)
        .def_readwrite("messages",   &InferenceRequest::messages)
        .def_readwrite("max_tokens", &InferenceRequest::max_tokens);

    py::class_<InferenceResult>(provider_mod, "InferenceResult")
        .def(py::init<>())
        .def_readwrite("content",       &InferenceResult::content)
        .def_readwrite("input_tokens",  &InferenceResult::input_tokens)
        .def_readwrite("output_tokens", &InferenceResult::output_tokens)
        .def_readwrite("cached_tokens", &InferenceResult::cached_tokens)
        .def_readwrite("generation_id", &InferenceResult::generation_id);

    // ---- Context-length errors ----------------------------------------------
    py::class_<ContextLengthError>(provider_mod, "ContextLengthError")
        .def(py::init<>())
        .def_readwrite("max_context",      &ContextLengthError::max_context)
        .def_readwrite("text_input",       &ContextLengthError::text_input)
        .def_readwrite("requested_output", &ContextLengthError::requested_output)
        .def("__repr__", [](const ContextLengthError& e) {
            return "<ContextLengthError max_context=" + std::to_string(e.max_context)
                 + " text_input=" + std::to_string(e.text_input)
                 + " requested_output=" + std::to_string(e.requested_output) + ">";
        });

    provider_mod.def("parse_context_length_error", &parse_context_length_error,
                     py::arg("message"));

    // ---- InferenceClient ----------------------------------------------------
    py::class_<InferenceClient, PyInferenceClient, std::shared_ptr<InferenceClient>>(
            provider_mod, "InferenceClient")
        .def(py::init<>())
        .def("stream_completion", &InferenceClient::stream_completion,
             py::arg("request"), py::arg("on_token"));

    // ---- CapacityGuard ------------------------------------------------------
    py::class_<CapacityGuard>(provider_mod, "CapacityGuard")
        .def(py::init<BudgetConfig>(), py::arg("config") = BudgetConfig{})
        .def("stream", &CapacityGuard::stream,
             py::arg("client"), py::arg("request"), py::arg("on_token"),
             py::call_guard<py::gil_scoped_release>())
        .def("set_monitor", &CapacityGuard::set_monitor, py::arg("monitor"));
}
