#pragma once

#include <NvInfer.h>
#include <cuda_runtime.h>

#include <memory>
#include <string>
#include <vector>

#include "inference_invoker.hpp"

// TensorRT Logger
class TRTLogger : public nvinfer1::ILogger {
public:
  void log(Severity severity, const char* msg) noexcept override;

private:
  Severity min_severity_ = Severity::kWARNING;
};

// Serialized TensorRT engine exposing its I/O tensors by name and shape.
// Expects one image input, [1,H,W,3] (NHWC) or [1,3,H,W] (NCHW), of uint8 or
// float type; float inputs are scaled to [-1,1] the way float SSD exports are.
class TensorRTInvoker : public InferenceInvoker {
public:
  explicit TensorRTInvoker(const std::string& engine_path);
  ~TensorRTInvoker() override;

  TensorRTInvoker(const TensorRTInvoker&) = delete;
  TensorRTInvoker& operator=(const TensorRTInvoker&) = delete;

  InputSpec input() const override { return input_; }
  std::vector<TensorDescriptor> outputs() const override;
  bool invoke(const std::vector<uint8_t>& rgb, OutputBuffers& outputs) override;
  std::string name() const override { return engine_path_; }

private:
  struct Binding {
    std::string name;
    nvinfer1::DataType type{nvinfer1::DataType::kFLOAT};
    std::vector<int64_t> shape;
    size_t elements{0};
    void* device{nullptr};
  };

  bool loadEngine();
  void allocateBuffers();
  void freeBuffers();
  bool stageInput(const std::vector<uint8_t>& rgb);

  std::string engine_path_;
  std::unique_ptr<TRTLogger> logger_;
  std::unique_ptr<nvinfer1::IRuntime> runtime_;
  std::unique_ptr<nvinfer1::ICudaEngine> engine_;
  std::unique_ptr<nvinfer1::IExecutionContext> context_;

  Binding input_binding_;
  bool input_nchw_{false};
  std::vector<Binding> output_bindings_;
  InputSpec input_;

  std::vector<uint8_t> host_u8_;
  std::vector<float> host_f32_;
  std::vector<int32_t> host_i32_;
  cudaStream_t stream_{nullptr};
};
