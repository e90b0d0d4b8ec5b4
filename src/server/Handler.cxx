// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Handler.hxx"
#include "Config.hxx"
#include "HttpError.hxx"
#include "http/HeaderList.hxx"
#include "http/Multipart.hxx"
#include "http/Range.hxx"
#include "http/RequestContext.hxx"
#include "http/server/Request.hxx"
#include "http/server/Response.hxx"
#include "io/FileName.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/nlohmann_json/String.hxx"
#include "net/SocketProtocolError.hxx"
#include "stream/Plan.hxx"
#include "stream/Streamer.hxx"
#include "system/Error.hxx"
#include "upload/ChunkReceiver.hxx"
#include "upload/Config.hxx"
#include "upload/DirectUpload.hxx"
#include "upload/Error.hxx"
#include "upload/Finalizer.hxx"
#include "uri/Unescape.hxx"
#include "util/Exception.hxx"
#include "util/FormatBytes.hxx"
#include "util/NumberParser.hxx"
#include "util/SpanCast.hxx"
#include "util/StringCompare.hxx"

#include <fmt/format.h>

#include <cerrno>
#include <system_error>
#include <vector>

#include <sys/stat.h>

using json = nlohmann::json;

static constexpr std::string_view VIDEOS_PREFIX = "/videos/";
static constexpr std::string_view STREAM_PREFIX = "/videos/stream/";
static constexpr std::string_view UPLOAD_PATH = "/videos/upload";
static constexpr std::string_view UPLOAD_CHUNK_PATH = "/videos/upload-chunk";
static constexpr std::string_view FINALIZE_PATH = "/videos/finalize-upload";

/**
 * Space for the multipart framing around the chunk data.
 */
static constexpr uint64_t MULTIPART_OVERHEAD = 64 * 1024;

static constexpr uint64_t MAX_FINALIZE_BODY = 64 * 1024;

static bool
IsUploadPath(std::string_view path) noexcept
{
	return path == UPLOAD_PATH || path == UPLOAD_CHUNK_PATH ||
		path == FINALIZE_PATH;
}

HttpHeaderList
MakeDefaultHeaders(const Config &config)
{
	HttpHeaderList headers;

	if (!config.cors_origin.empty()) {
		headers.Add("access-control-allow-origin", config.cors_origin);
		headers.Add("access-control-allow-credentials", "true");
		headers.Add("access-control-expose-headers",
			    "Content-Range, Content-Length, Accept-Ranges");
		headers.Add("vary", "Origin");
	}

	return headers;
}

static Co::Task<void>
SendJson(HttpServerResponse &response, HttpStatus status, const json &j,
	 const HttpHeaderList &extra_headers={}, bool send_body=true)
{
	HttpHeaderList headers = extra_headers;
	headers.Add("content-type", "application/json");

	const auto body = j.dump();
	co_await response.SendResponse(status, headers, body, send_body);
}

uint64_t
RequestHandler::GetMaxRequestBody(const HttpServerRequest &request) const noexcept
{
	const auto path = request.GetPath();

	if (path == UPLOAD_PATH)
		return config.upload.max_upload_size + MULTIPART_OVERHEAD;

	if (path == UPLOAD_CHUNK_PATH)
		return config.upload.max_chunk_size + MULTIPART_OVERHEAD;

	if (path == FINALIZE_PATH)
		return MAX_FINALIZE_BODY;

	return 0;
}

static void
CheckMethod(HttpMethod method, bool allowed, const char *allow)
{
	if (method == HttpMethod::INVALID)
		throw HttpError(HttpStatus::NOT_IMPLEMENTED,
				"Method not implemented");

	if (!allowed)
		throw HttpError::MethodNotAllowed(allow);
}

Co::Task<void>
RequestHandler::HandlePreflight(const HttpServerRequest &request,
				HttpServerResponse &response)
{
	HttpHeaderList headers;
	headers.Add("access-control-allow-methods",
		    "GET, HEAD, POST, OPTIONS");

	if (const auto *h = request.GetHeader("access-control-request-headers"))
		headers.Add("access-control-allow-headers", *h);
	else
		headers.Add("access-control-allow-headers", "Content-Type, Range");

	headers.Add("access-control-max-age", "86400");

	co_await response.SendResponse(HttpStatus::NO_CONTENT, headers, {});
}

/**
 * Open a file in the video directory.
 *
 * Throws #HttpError if the file does not exist.
 */
static UniqueFileDescriptor
OpenVideo(FileDescriptor directory, const std::string &filename)
{
	UniqueFileDescriptor fd;

	try {
		fd = OpenReadOnly(directory, filename.c_str());
	} catch (const std::system_error &e) {
		if (e.code() == std::errc::no_such_file_or_directory ||
		    e.code() == std::errc::not_a_directory)
			throw HttpError(HttpStatus::NOT_FOUND, "Video not found");

		throw;
	}

	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		throw MakeErrno("Failed to stat video file");

	if (!S_ISREG(st.st_mode))
		throw HttpError(HttpStatus::NOT_FOUND, "Video not found");

	return fd;
}

Co::Task<void>
RequestHandler::HandleStream(const RequestContext &ctx,
			     const HttpServerRequest &request,
			     HttpServerResponse &response,
			     std::string_view escaped_filename,
			     std::string &filename_r)
{
	auto filename = UriUnescape(escaped_filename);
	if (!filename || !IsPlainFilename(*filename))
		throw HttpError(HttpStatus::NOT_FOUND, "Video not found");

	filename_r = std::move(*filename);

	auto fd = OpenVideo(video_directory, filename_r);

	const off_t size = fd.GetSize();
	if (size < 0)
		throw MakeErrno("Failed to stat video file");

	HttpRangeRequest range(size);

	const auto *range_header = request.GetHeader("range");
	if (range_header != nullptr)
		range.ParseRangeHeader(*range_header);

	ctx.logger.Fmt(2, "stream '{}' ({}), range: {}",
		       filename_r, FormatBytes(size),
		       range_header != nullptr ? std::string_view{*range_header} : "none");

	const auto plan = MakeStreamPlan(range);

	MediaStreamer streamer(ctx, std::move(fd), plan,
			       config.stream_block_size);
	co_await streamer.Run(response, request.method != HttpMethod::HEAD);
}

Co::Task<void>
RequestHandler::HandleVideoInfo(const RequestContext &ctx,
				const HttpServerRequest &request,
				HttpServerResponse &response,
				std::string_view escaped_filename,
				std::string &filename_r)
{
	auto filename = UriUnescape(escaped_filename);
	if (!filename || !IsPlainFilename(*filename))
		throw HttpError(HttpStatus::NOT_FOUND, "Video not found");

	filename_r = std::move(*filename);

	const auto fd = OpenVideo(video_directory, filename_r);

	const off_t size = fd.GetSize();
	if (size < 0)
		throw MakeErrno("Failed to stat video file");

	ctx.logger.Fmt(3, "info '{}' ({})", filename_r, FormatBytes(size));

	const json info{
		{"filename", filename_r},
		{"size", size},
		{"sizeFormatted", FormatBytes(size)},
	};
	co_await SendJson(response, HttpStatus::OK, info,
			  {}, request.method != HttpMethod::HEAD);
}

/**
 * Find the multipart boundary of a request body.
 *
 * Throws #HttpError if the body is not "multipart/form-data".
 */
static std::string_view
GetRequestBoundary(const HttpServerRequest &request)
{
	const auto *content_type = request.GetHeader("content-type");
	const auto boundary = content_type != nullptr
		? GetMultipartBoundary(*content_type)
		: std::string_view{};
	if (boundary.empty())
		throw HttpError(HttpStatus::BAD_REQUEST,
				"Expected multipart/form-data");

	return boundary;
}

Co::Task<void>
RequestHandler::HandleDirectUpload(const RequestContext &ctx,
				   const HttpServerRequest &request,
				   HttpServerResponse &response,
				   std::string &filename_r)
{
	const auto parts = ParseMultipart(request.body,
					  GetRequestBoundary(request));

	const auto *video = FindMultipartPart(parts, "video");
	if (video == nullptr)
		throw UploadError(UploadErrorCode::INVALID_FIELD,
				  "Missing field 'video'");

	filename_r = video->filename;

	const auto result = co_await direct_uploader.Store(ctx, filename_r,
							   AsBytes(video->value));

	const json body{
		{"success", true},
		{"filename", result.filename},
		{"size", result.size},
		{"sizeFormatted", FormatBytes(result.size)},
	};
	co_await SendJson(response, HttpStatus::OK, body);
}

/**
 * Parse a numeric multipart field.
 *
 * Throws #UploadError if the field is missing or malformed.
 */
template<typename T>
static T
GetNumericField(const std::vector<MultipartPart> &parts, const char *name)
{
	const auto *part = FindMultipartPart(parts, name);
	if (part == nullptr)
		throw UploadError(UploadErrorCode::INVALID_FIELD,
				  fmt::format("Missing field '{}'", name));

	const auto value = ParseInteger<T>(part->value);
	if (!value)
		throw UploadError(UploadErrorCode::INVALID_FIELD,
				  fmt::format("Invalid field '{}'", name));

	return *value;
}

Co::Task<void>
RequestHandler::HandleUploadChunk(const RequestContext &ctx,
				  const HttpServerRequest &request,
				  HttpServerResponse &response,
				  std::string &filename_r)
{
	const auto parts = ParseMultipart(request.body,
					  GetRequestBoundary(request));

	if (const auto *part = FindMultipartPart(parts, "filename"))
		filename_r = part->value;

	const auto *chunk = FindMultipartPart(parts, "chunk");
	if (chunk == nullptr)
		throw UploadError(UploadErrorCode::INVALID_FIELD,
				  "Missing field 'chunk'");

	const UploadChunk upload_chunk{
		filename_r,
		GetNumericField<unsigned>(parts, "chunkNumber"),
		GetNumericField<unsigned>(parts, "totalChunks"),
		GetNumericField<uint64_t>(parts, "fileSize"),
		AsBytes(chunk->value),
	};

	const auto result = co_await chunk_receiver.Receive(ctx, upload_chunk);

	ctx.logger.Fmt(2, "received chunk {}/{} of '{}' ({})",
		       result.chunk_number, result.total_chunks,
		       filename_r, FormatBytes(chunk->value.size()));

	const json body{
		{"success", true},
		{"chunkNumber", result.chunk_number},
		{"received", result.received},
		{"totalChunks", result.total_chunks},
	};
	co_await SendJson(response, HttpStatus::OK, body);
}

Co::Task<void>
RequestHandler::HandleFinalize(const RequestContext &ctx,
			       const HttpServerRequest &request,
			       HttpServerResponse &response,
			       std::string &filename_r)
{
	const auto j = json::parse(request.body);
	if (!j.is_object())
		throw HttpError(HttpStatus::BAD_REQUEST, "JSON object expected");

	filename_r = Json::GetStringRobust(j, "filename");

	const auto total_chunks = Json::GetUnsignedRobust<unsigned>(j, "totalChunks");
	if (!total_chunks)
		throw UploadError(UploadErrorCode::INVALID_FIELD,
				  "Missing or invalid field 'totalChunks'");

	const auto file_size = Json::GetUnsignedRobust<uint64_t>(j, "fileSize");
	if (!file_size)
		throw UploadError(UploadErrorCode::INVALID_FIELD,
				  "Missing or invalid field 'fileSize'");

	const auto result = co_await finalizer.Finalize(ctx, {
			filename_r,
			*total_chunks,
			*file_size,
		});

	const json body{
		{"success", true},
		{"filename", result.filename},
		{"size", result.size},
		{"sizeFormatted", FormatBytes(result.size)},
	};
	co_await SendJson(response, HttpStatus::OK, body);
}

Co::Task<void>
RequestHandler::Dispatch(const RequestContext &ctx,
			 HttpServerRequest &request,
			 HttpServerResponse &response,
			 std::string &filename_r)
{
	const auto method = request.method;
	const auto path = request.GetPath();

	if (method == HttpMethod::OPTIONS && !config.cors_origin.empty()) {
		co_await HandlePreflight(request, response);
		co_return;
	}

	if (std::string_view rest = path; SkipPrefix(rest, STREAM_PREFIX)) {
		CheckMethod(method,
			    method == HttpMethod::GET || method == HttpMethod::HEAD,
			    "GET, HEAD");
		co_await HandleStream(ctx, request, response, rest, filename_r);
	} else if (path == UPLOAD_PATH) {
		CheckMethod(method, method == HttpMethod::POST, "POST");
		co_await HandleDirectUpload(ctx, request, response, filename_r);
	} else if (path == UPLOAD_CHUNK_PATH) {
		CheckMethod(method, method == HttpMethod::POST, "POST");
		co_await HandleUploadChunk(ctx, request, response, filename_r);
	} else if (path == FINALIZE_PATH) {
		CheckMethod(method, method == HttpMethod::POST, "POST");
		co_await HandleFinalize(ctx, request, response, filename_r);
	} else if (std::string_view name = path;
		   SkipPrefix(name, VIDEOS_PREFIX) && !name.empty()) {
		CheckMethod(method,
			    method == HttpMethod::GET || method == HttpMethod::HEAD,
			    "GET, HEAD");
		co_await HandleVideoInfo(ctx, request, response, name, filename_r);
	} else
		throw HttpError(HttpStatus::NOT_FOUND, "Not found");
}

Co::Task<void>
RequestHandler::HandleHttpRequest(HttpServerRequest &request,
				  HttpServerResponse &response)
{
	const RequestContext ctx(logger);

	ctx.logger.Fmt(2, "{} {}",
		       http_method_to_string(request.method) != nullptr
		       ? http_method_to_string(request.method) : "?",
		       request.uri);

	std::string filename;
	std::exception_ptr error;

	try {
		co_await Dispatch(ctx, request, response, filename);
	} catch (...) {
		error = std::current_exception();
	}

	if (error)
		co_await HandleError(ctx, request, response, std::move(error),
				     filename);
}

static HttpStatus
ToHttpStatus(UploadErrorCode code) noexcept
{
	switch (code) {
	case UploadErrorCode::INVALID_FILENAME:
	case UploadErrorCode::INVALID_FILE_TYPE:
	case UploadErrorCode::INVALID_FIELD:
	case UploadErrorCode::INVALID_CHUNK_ORDINAL:
		return HttpStatus::BAD_REQUEST;

	case UploadErrorCode::CHUNK_TOO_LARGE:
	case UploadErrorCode::UPLOAD_TOO_LARGE:
		return HttpStatus::REQUEST_ENTITY_TOO_LARGE;

	case UploadErrorCode::SESSION_MISMATCH:
	case UploadErrorCode::INCOMPLETE_UPLOAD:
	case UploadErrorCode::ARTIFACT_EXISTS:
		return HttpStatus::CONFLICT;

	case UploadErrorCode::UNKNOWN_SESSION:
		return HttpStatus::NOT_FOUND;

	case UploadErrorCode::SIZE_MISMATCH:
		return HttpStatus::UNPROCESSABLE_ENTITY;

	case UploadErrorCode::IO_FAILURE:
		break;
	}

	return HttpStatus::INTERNAL_SERVER_ERROR;
}

Co::Task<void>
RequestHandler::HandleError(const RequestContext &ctx,
			    const HttpServerRequest &request,
			    HttpServerResponse &response,
			    std::exception_ptr error,
			    std::string_view filename)
{
	if (response.IsHeadSent()) {
		/* too late for an error response */
		ctx.logger(1, error);
		response.Abort();
		co_return;
	}

	const bool upload = IsUploadPath(request.GetPath());

	HttpStatus status = HttpStatus::INTERNAL_SERVER_ERROR;
	json j;
	HttpHeaderList headers;

	if (upload)
		j["success"] = false;

	try {
		std::rethrow_exception(error);
	} catch (const SocketClosedPrematurelyError &) {
		/* the client is gone; the connection will be closed */
		throw;
	} catch (const HttpError &e) {
		status = e.GetStatus();
		j["error"] = e.what();
		if (e.GetAllow() != nullptr)
			headers.Add("allow", e.GetAllow());
		ctx.logger(2, e.what());
	} catch (const HttpRangeError &e) {
		if (e.IsUnsatisfiable()) {
			status = HttpStatus::REQUESTED_RANGE_NOT_SATISFIABLE;
			j["error"] = "Range Not Satisfiable";
			headers.Add("content-range",
				    fmt::format("bytes */{}", e.GetSize()));
		} else {
			status = HttpStatus::BAD_REQUEST;
			j["error"] = "Malformed Range header";
		}

		j["details"] = e.what();
		ctx.logger(2, e.what());
	} catch (const StreamError &e) {
		j["error"] = "Streaming error";
		j["details"] = GetFullMessage(e);
		ctx.logger(1, error);
	} catch (const UploadError &e) {
		status = ToHttpStatus(e.GetCode());
		j["error"] = e.what();
		j["code"] = ToString(e.GetCode());

		switch (e.GetCode()) {
		case UploadErrorCode::INCOMPLETE_UPLOAD:
			j["missing"] = e.GetMissing();
			break;

		case UploadErrorCode::SIZE_MISMATCH:
			j["expected"] = e.GetExpected();
			j["actual"] = e.GetActual();
			break;

		case UploadErrorCode::IO_FAILURE:
			j["details"] = GetFullMessage(e);
			break;

		default:
			break;
		}

		if (status == HttpStatus::INTERNAL_SERVER_ERROR)
			ctx.logger(1, error);
		else
			ctx.logger(2, e.what());
	} catch (const MultipartError &e) {
		status = HttpStatus::BAD_REQUEST;
		j["error"] = e.what();
		ctx.logger(2, e.what());
	} catch (const json::exception &e) {
		status = HttpStatus::BAD_REQUEST;
		j["error"] = "Malformed JSON request";
		j["details"] = e.what();
		ctx.logger(2, e.what());
	} catch (...) {
		j["error"] = "Internal server error";
		ctx.logger(1, error);
	}

	j["requestId"] = ctx.id;
	if (!filename.empty())
		j["filename"] = filename;

	co_await SendJson(response, status, j, headers,
			  request.method != HttpMethod::HEAD);
}
