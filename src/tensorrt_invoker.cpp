#include "tensorrt_invoker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "detector.hpp"

namespace {

size_t type_size(nvinfer1::DataType t) {
  switch (t) {
    case nvinfer1::DataType::kFLOAT: return 4;
    case nvinfer1::DataType::kINT32: return 4;
    case nvinfer1::DataType::kUINT8: return 1;
    default: return 0;
  }
}

std::vector<int64_t> to_shape(const nvinfer1::Dims& d) {
  std::vector<int64_t> s;
  for (int32_t i = 0; i < d.nbDims; ++i) s.push_back(d.d[i]);
  return s;
}

}  // namespace

// TensorRT Logger Implementation
void TRTLogger::log(Severity severity, const char* msg) noexcept {
  if (severity <= min_severity_) {
    switch (severity) {
      case Severity::kERROR:
        spdlog::error("[TensorRT] {}", msg);
        break;
      case Severity::kWARNING:
        spdlog::warn("[TensorRT] {}", msg);
        break;
      case Severity::kINFO:
        spdlog::info("[TensorRT] {}", msg);
        break;
      case Severity::kVERBOSE:
        spdlog::debug("[TensorRT] {}", msg);
        break;
      case Severity::kINTERNAL_ERROR:
        spdlog::critical("[TensorRT] {}", msg);
        break;
    }
  }
}

TensorRTInvoker::TensorRTInvoker(const std::string& engine_path)
    : engine_path_(engine_path), logger_(std::make_unique<TRTLogger>()) {
  if (!loadEngine()) {
    throw ModelLoadError("Failed to load TensorRT engine: " + engine_path_);
  }
  allocateBuffers();

  if (cudaStreamCreate(&stream_) != cudaSuccess) {
    freeBuffers();
    throw ModelLoadError("Failed to create CUDA stream");
  }
  spdlog::info("TensorRT engine loaded successfully from {}", engine_path_);
}

TensorRTInvoker::~TensorRTInvoker() {
  freeBuffers();
  if (stream_) {
    cudaStreamDestroy(stream_);
  }
}

bool TensorRTInvoker::loadEngine() {
  std::ifstream file(engine_path_, std::ios::binary);
  if (!file.good()) {
    spdlog::error("Engine file not found: {}", engine_path_);
    return false;
  }

  file.seekg(0, std::ios::end);
  size_t size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<char> engine_data(size);
  file.read(engine_data.data(), size);
  file.close();

  runtime_.reset(nvinfer1::createInferRuntime(*logger_));
  if (!runtime_) {
    spdlog::error("Failed to create TensorRT runtime");
    return false;
  }

  engine_.reset(runtime_->deserializeCudaEngine(engine_data.data(), size));
  if (!engine_) {
    spdlog::error("Failed to deserialize TensorRT engine");
    return false;
  }

  context_.reset(engine_->createExecutionContext());
  if (!context_) {
    spdlog::error("Failed to create execution context");
    return false;
  }

  bool have_input = false;
  for (int32_t i = 0; i < engine_->getNbIOTensors(); ++i) {
    const char* tensor_name = engine_->getIOTensorName(i);
    Binding b;
    b.name = tensor_name;
    b.type = engine_->getTensorDataType(tensor_name);
    b.shape = to_shape(engine_->getTensorShape(tensor_name));
    b.elements = element_count(b.shape);
    if (type_size(b.type) == 0) {
      spdlog::error("Tensor '{}' has an unsupported data type", b.name);
      return false;
    }

    if (engine_->getTensorIOMode(tensor_name) == nvinfer1::TensorIOMode::kINPUT) {
      if (have_input) {
        spdlog::error("Engine has more than one input tensor");
        return false;
      }
      have_input = true;
      input_binding_ = b;
    } else {
      if (b.type == nvinfer1::DataType::kUINT8) {
        spdlog::error("Output '{}' is uint8; only float and int32 outputs are supported", b.name);
        return false;
      }
      output_bindings_.push_back(b);
    }
  }

  if (!have_input || input_binding_.shape.size() != 4) {
    spdlog::error("Engine needs a single rank-4 image input");
    return false;
  }

  const auto& s = input_binding_.shape;
  input_nchw_ = (s[1] == 3 && s[3] != 3);
  input_.height = static_cast<int>(input_nchw_ ? s[2] : s[1]);
  input_.width = static_cast<int>(input_nchw_ ? s[3] : s[2]);
  input_.channels = static_cast<int>(input_nchw_ ? s[1] : s[3]);
  spdlog::info("TensorRT input '{}' {} ({})", input_binding_.name, shape_to_string(s),
               input_nchw_ ? "NCHW" : "NHWC");
  return true;
}

void TensorRTInvoker::allocateBuffers() {
  auto alloc = [this](Binding& b) {
    const size_t bytes = b.elements * type_size(b.type);
    if (cudaMalloc(&b.device, bytes) != cudaSuccess) {
      freeBuffers();
      throw ModelLoadError("cudaMalloc failed for tensor '" + b.name + "'");
    }
    context_->setTensorAddress(b.name.c_str(), b.device);
  };

  alloc(input_binding_);
  for (auto& b : output_bindings_) alloc(b);
}

void TensorRTInvoker::freeBuffers() {
  if (input_binding_.device) {
    cudaFree(input_binding_.device);
    input_binding_.device = nullptr;
  }
  for (auto& b : output_bindings_) {
    if (b.device) {
      cudaFree(b.device);
      b.device = nullptr;
    }
  }
}

std::vector<TensorDescriptor> TensorRTInvoker::outputs() const {
  std::vector<TensorDescriptor> out;
  out.reserve(output_bindings_.size());
  for (const auto& b : output_bindings_) out.push_back({b.name, b.shape});
  return out;
}

bool TensorRTInvoker::stageInput(const std::vector<uint8_t>& rgb) {
  if (rgb.size() != input_.byte_size()) {
    spdlog::error("Input size mismatch: expected {} bytes, got {}", input_.byte_size(), rgb.size());
    return false;
  }

  const size_t hw = static_cast<size_t>(input_.width) * static_cast<size_t>(input_.height);
  auto src_index = [&](size_t i) {
    // i walks the destination layout; NHWC needs no reordering
    if (!input_nchw_) return i;
    const size_t c = i / hw;
    const size_t p = i % hw;
    return p * 3 + c;
  };

  if (input_binding_.type == nvinfer1::DataType::kUINT8) {
    host_u8_.resize(rgb.size());
    for (size_t i = 0; i < rgb.size(); ++i) host_u8_[i] = rgb[src_index(i)];
    return cudaMemcpyAsync(input_binding_.device, host_u8_.data(), host_u8_.size(),
                           cudaMemcpyHostToDevice, stream_) == cudaSuccess;
  }

  host_f32_.resize(rgb.size());
  for (size_t i = 0; i < rgb.size(); ++i) {
    host_f32_[i] = (static_cast<float>(rgb[src_index(i)]) - 127.5f) / 127.5f;
  }
  return cudaMemcpyAsync(input_binding_.device, host_f32_.data(), host_f32_.size() * sizeof(float),
                         cudaMemcpyHostToDevice, stream_) == cudaSuccess;
}

bool TensorRTInvoker::invoke(const std::vector<uint8_t>& rgb, OutputBuffers& outputs) {
  if (!context_) {
    spdlog::error("TensorRT engine not properly initialized");
    return false;
  }

  if (!stageInput(rgb)) {
    spdlog::error("Failed to copy input to device");
    return false;
  }

  if (!context_->enqueueV3(stream_)) {
    spdlog::error("TensorRT inference failed");
    return false;
  }

  for (auto& kv : outputs) {
    const int slot = kv.first;
    if (slot < 0 || slot >= static_cast<int>(output_bindings_.size())) {
      spdlog::error("Requested output slot {} does not exist", slot);
      return false;
    }
    const Binding& b = output_bindings_[static_cast<size_t>(slot)];
    std::vector<float>& dst = kv.second;
    const size_t n = std::min(dst.size(), b.elements);

    if (b.type == nvinfer1::DataType::kFLOAT) {
      if (cudaMemcpyAsync(dst.data(), b.device, n * sizeof(float), cudaMemcpyDeviceToHost,
                          stream_) != cudaSuccess) {
        spdlog::error("Failed to copy output '{}' from device", b.name);
        return false;
      }
    } else {
      host_i32_.resize(n);
      if (cudaMemcpyAsync(host_i32_.data(), b.device, n * sizeof(int32_t),
                          cudaMemcpyDeviceToHost, stream_) != cudaSuccess ||
          cudaStreamSynchronize(stream_) != cudaSuccess) {
        spdlog::error("Failed to copy output '{}' from device", b.name);
        return false;
      }
      for (size_t i = 0; i < n; ++i) dst[i] = static_cast<float>(host_i32_[i]);
    }
  }

  return cudaStreamSynchronize(stream_) == cudaSuccess;
}
