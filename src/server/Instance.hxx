// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Handler.hxx"
#include "Listener.hxx"
#include "event/Loop.hxx"
#include "event/ShutdownListener.hxx"
#include "http/HeaderList.hxx"
#include "http/server/Connection.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "upload/ChunkReceiver.hxx"
#include "upload/DirectUpload.hxx"
#include "upload/Finalizer.hxx"
#include "upload/Pruner.hxx"
#include "upload/Registry.hxx"
#include "util/IntrusiveList.hxx"

struct Config;

class Instance final
	: HttpServerConnectionFactory, HttpServerConnectionHandler
{
	const Config &config;

	EventLoop event_loop;

	ShutdownListener shutdown_listener;

	const UniqueFileDescriptor video_directory, chunk_directory;

	const HttpHeaderList default_headers;

	UploadSessionRegistry registry;

	ChunkReceiver chunk_receiver;

	UploadFinalizer finalizer;

	DirectUploader direct_uploader;

	UploadPruner pruner;

	RequestHandler handler;

	Listener listener;

	IntrusiveList<HttpServerConnection> connections;

public:
	/**
	 * Throws on error.
	 */
	explicit Instance(const Config &_config);

	~Instance() noexcept;

	Instance(const Instance &) = delete;
	Instance &operator=(const Instance &) = delete;

	/**
	 * Start listening and run the event loop until a shutdown
	 * signal is received.
	 *
	 * Throws on error.
	 */
	void Run();

private:
	void OnShutdown() noexcept;

	/* virtual methods from class HttpServerConnectionFactory */
	void OnNewConnection(UniqueSocketDescriptor &&socket) noexcept override;

	/* virtual methods from class HttpServerConnectionHandler */
	void OnHttpConnectionClosed(HttpServerConnection &connection) noexcept override;
};
