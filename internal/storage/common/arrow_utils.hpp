#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/io/memory.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/record_batch.h>
#include <arrow/result.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace soilhex::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

/*
  Single record batch <-> Arrow IPC stream bytes
*/
inline std::shared_ptr<arrow::Buffer> SerializeBatch(const std::shared_ptr<arrow::RecordBatch>& batch) {
  auto sink   = Unwrap(arrow::io::BufferOutputStream::Create());
  auto writer = Unwrap(arrow::ipc::MakeStreamWriter(sink, batch->schema()));
  Unwrap(writer->WriteRecordBatch(*batch));
  Unwrap(writer->Close());
  return Unwrap(sink->Finish());
}

inline std::shared_ptr<arrow::RecordBatch> DeserializeBatch(const std::shared_ptr<arrow::Buffer>& buffer) {
  auto input  = std::make_shared<arrow::io::BufferReader>(buffer);
  auto reader = Unwrap(arrow::ipc::RecordBatchStreamReader::Open(input));

  std::shared_ptr<arrow::RecordBatch> batch;
  Unwrap(reader->ReadNext(&batch));
  if (!batch) throw std::runtime_error("IPC stream contains no record batch");
  return batch;
}

} // namespace soilhex::storage::common
