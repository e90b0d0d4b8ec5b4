// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/server/Handler.hxx"
#include "http/Method.hxx"
#include "io/FileDescriptor.hxx"
#include "io/Logger.hxx"

#include <exception>
#include <string>
#include <string_view>

struct Config;
struct RequestContext;
class HttpHeaderList;
class ChunkReceiver;
class UploadFinalizer;
class DirectUploader;

/**
 * Dispatches requests to the video streaming and upload operations.
 */
class RequestHandler final : public HttpServerHandler {
	const LLogger logger{"request"};

	const Config &config;

	const FileDescriptor video_directory;

	ChunkReceiver &chunk_receiver;

	UploadFinalizer &finalizer;

	DirectUploader &direct_uploader;

public:
	RequestHandler(const Config &_config,
		       FileDescriptor _video_directory,
		       ChunkReceiver &_chunk_receiver,
		       UploadFinalizer &_finalizer,
		       DirectUploader &_direct_uploader) noexcept
		:config(_config), video_directory(_video_directory),
		 chunk_receiver(_chunk_receiver), finalizer(_finalizer),
		 direct_uploader(_direct_uploader) {}

	/* virtual methods from class HttpServerHandler */
	uint64_t GetMaxRequestBody(const HttpServerRequest &request) const noexcept override;
	Co::Task<void> HandleHttpRequest(HttpServerRequest &request,
					 HttpServerResponse &response) override;

private:
	Co::Task<void> Dispatch(const RequestContext &ctx,
				HttpServerRequest &request,
				HttpServerResponse &response,
				std::string &filename_r);

	Co::Task<void> HandleStream(const RequestContext &ctx,
				    const HttpServerRequest &request,
				    HttpServerResponse &response,
				    std::string_view escaped_filename,
				    std::string &filename_r);

	Co::Task<void> HandleVideoInfo(const RequestContext &ctx,
				       const HttpServerRequest &request,
				       HttpServerResponse &response,
				       std::string_view escaped_filename,
				       std::string &filename_r);

	Co::Task<void> HandleDirectUpload(const RequestContext &ctx,
					  const HttpServerRequest &request,
					  HttpServerResponse &response,
					  std::string &filename_r);

	Co::Task<void> HandleUploadChunk(const RequestContext &ctx,
					 const HttpServerRequest &request,
					 HttpServerResponse &response,
					 std::string &filename_r);

	Co::Task<void> HandleFinalize(const RequestContext &ctx,
				      const HttpServerRequest &request,
				      HttpServerResponse &response,
				      std::string &filename_r);

	Co::Task<void> HandlePreflight(const HttpServerRequest &request,
				       HttpServerResponse &response);

	Co::Task<void> HandleError(const RequestContext &ctx,
				   const HttpServerRequest &request,
				   HttpServerResponse &response,
				   std::exception_ptr error,
				   std::string_view filename);
};

/**
 * Generate the headers which are added to all responses.
 */
HttpHeaderList
MakeDefaultHeaders(const Config &config);
