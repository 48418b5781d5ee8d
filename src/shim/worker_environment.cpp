/**
 * Worker environment for the geometry kernel
 *
 * The JS half lives in kEnvironmentSource: a factory that receives the
 * native functions below and returns the primitives the kernel sees. The
 * kernel source is then wrapped in a function whose parameters are those
 * primitives (same trick the browser worker polyfill uses for blob workers).
 */

#include "scadhost/shim/worker_environment.h"
#include "scadhost/protocol/base64.h"
#include <algorithm>
#include <iostream>
#include <random>

namespace scadhost {
namespace shim {

namespace {

// Order matters: it is both the kernel wrapper's parameter list and the
// lookup order on the environment object.
const char* const kInjectedNames[] = {
    "self", "postMessage", "addEventListener", "removeEventListener",
    "importScripts", "location", "fetch", "Response", "Headers", "Blob",
    "URL", "URLSearchParams", "TextEncoder", "TextDecoder", "WebAssembly",
    "setTimeout", "clearTimeout", "setInterval", "clearInterval",
    "queueMicrotask", "performance", "crypto", "module", "exports", "require",
};

const char* kEnvironmentSource = R"JS(
(function (native, kernelUrl) {
'use strict';

function describe(err) {
    if (err && err.stack) return String(err.stack);
    return String(err);
}

function reportUncaught(err) {
    native.reportError(describe(err));
}

// TextEncoder / TextDecoder (UTF-8 only, conversion done natively)
class TextEncoder {
    constructor() {
        this.encoding = 'utf-8';
    }
    encode(str = '') {
        return native.encodeUtf8(String(str));
    }
}

class TextDecoder {
    constructor(encoding = 'utf-8') {
        const label = String(encoding).toLowerCase();
        if (label !== 'utf-8' && label !== 'utf8') {
            throw new RangeError('TextDecoder: unsupported encoding ' + encoding);
        }
        this.encoding = 'utf-8';
    }
    decode(input) {
        if (input === undefined || input === null) return '';
        return native.decodeUtf8(input);
    }
}

function toBytes(part) {
    if (part === undefined || part === null) return new Uint8Array(0);
    if (part instanceof ArrayBuffer) return new Uint8Array(part.slice(0));
    if (ArrayBuffer.isView(part)) {
        return new Uint8Array(part.buffer.slice(part.byteOffset, part.byteOffset + part.byteLength));
    }
    if (part instanceof Blob) return new Uint8Array(part._data.slice(0));
    return native.encodeUtf8(String(part));
}

// Blob class (Web API standard)
class Blob {
    constructor(blobParts = [], options = {}) {
        this.type = options.type || '';

        const parts = [];
        let totalSize = 0;
        for (const part of blobParts) {
            const bytes = toBytes(part);
            parts.push(bytes);
            totalSize += bytes.byteLength;
        }

        const view = new Uint8Array(totalSize);
        let offset = 0;
        for (const part of parts) {
            view.set(part, offset);
            offset += part.byteLength;
        }

        this._data = view.buffer;
        this.size = totalSize;
    }

    async arrayBuffer() {
        return this._data.slice(0);
    }

    async text() {
        return native.decodeUtf8(this._data);
    }

    slice(start = 0, end = this.size, type = '') {
        return new Blob([new Uint8Array(this._data.slice(start, end))], { type });
    }
}

// Headers class - only what asset responses need
class Headers {
    constructor(init = {}) {
        this._headers = new Map();
        if (init instanceof Headers) {
            init.forEach((value, key) => this._headers.set(key, value));
        } else if (Array.isArray(init)) {
            init.forEach(([key, value]) => this._headers.set(String(key).toLowerCase(), String(value)));
        } else if (init && typeof init === 'object') {
            Object.entries(init).forEach(([key, value]) => this._headers.set(key.toLowerCase(), String(value)));
        }
    }
    get(name) { return this._headers.has(name.toLowerCase()) ? this._headers.get(name.toLowerCase()) : null; }
    set(name, value) { this._headers.set(name.toLowerCase(), String(value)); }
    has(name) { return this._headers.has(name.toLowerCase()); }
    forEach(callback) { this._headers.forEach((value, key) => callback(value, key, this)); }
    entries() { return this._headers.entries(); }
    [Symbol.iterator]() { return this._headers.entries(); }
}

const kHolder = Symbol('assetResponse');

function contentTypeFor(url) {
    if (/\.wasm([?#].*)?$/i.test(url)) return 'application/wasm';
    if (/\.js([?#].*)?$/i.test(url)) return 'text/javascript';
    return 'application/octet-stream';
}

// Response class. Responses from fetch() are backed by a native asset
// response; responses built by script hold their own bytes.
class Response {
    constructor(body = null, init = {}) {
        this[kHolder] = null;
        this._bytes = toBytes(body).buffer;
        this.status = init.status === undefined ? 200 : init.status;
        this.ok = this.status >= 200 && this.status < 300;
        this.statusText = init.statusText || '';
        this.url = '';
        this.headers = new Headers(init.headers || {});
        this.type = 'default';
        this.redirected = false;
        this.bodyUsed = false;
    }

    static _fromNative(holder) {
        const info = native.responseInfo(holder);
        const response = Object.create(Response.prototype);
        response[kHolder] = holder;
        response._bytes = null;
        response.ok = info.ok;
        response.status = info.status;
        response.statusText = info.statusText;
        response.url = info.url;
        response.headers = new Headers({
            'content-type': contentTypeFor(info.url),
            'content-length': String(info.size),
        });
        response.type = 'basic';
        response.redirected = false;
        response.bodyUsed = false;
        return response;
    }

    async arrayBuffer() {
        this.bodyUsed = true;
        return this[kHolder] ? native.responseBytes(this[kHolder]) : this._bytes.slice(0);
    }

    async text() {
        this.bodyUsed = true;
        return this[kHolder] ? native.responseText(this[kHolder]) : native.decodeUtf8(this._bytes);
    }

    async json() {
        return JSON.parse(await this.text());
    }

    async blob() {
        return new Blob([await this.arrayBuffer()], { type: this.headers.get('content-type') || '' });
    }

    clone() {
        if (this[kHolder]) {
            return Response._fromNative(native.responseClone(this[kHolder]));
        }
        const copy = new Response(this._bytes, { status: this.status, statusText: this.statusText, headers: this.headers });
        copy.url = this.url;
        return copy;
    }
}

// fetch - every request is answered from the local asset bundle. Never
// rejects: unresolved names produce an empty ok response, read failures
// an ok=false response with status 500.
function fetch(input, init) {
    const url = (input !== null && typeof input === 'object' && typeof input.url === 'string')
        ? input.url : String(input);
    return new Promise((resolve) => {
        native.fetchAsset(url, (holder) => resolve(Response._fromNative(holder)));
    });
}

// URLSearchParams polyfill
class URLSearchParams {
    constructor(init) {
        this._params = [];
        if (typeof init === 'string') {
            const str = init.startsWith('?') ? init.slice(1) : init;
            if (str) {
                str.split('&').forEach(pair => {
                    const eq = pair.indexOf('=');
                    const decode = s => decodeURIComponent(s.replace(/\+/g, ' '));
                    if (eq >= 0) {
                        this._params.push([decode(pair.slice(0, eq)), decode(pair.slice(eq + 1))]);
                    } else {
                        this._params.push([decode(pair), '']);
                    }
                });
            }
        } else if (init && typeof init === 'object') {
            const entries = Array.isArray(init) ? init : Object.entries(init);
            entries.forEach(([k, v]) => this._params.push([String(k), String(v)]));
        }
    }
    get(name) {
        const entry = this._params.find(([k]) => k === name);
        return entry ? entry[1] : null;
    }
    getAll(name) { return this._params.filter(([k]) => k === name).map(([, v]) => v); }
    has(name) { return this._params.some(([k]) => k === name); }
    set(name, value) {
        const idx = this._params.findIndex(([k]) => k === name);
        if (idx >= 0) this._params[idx] = [name, String(value)];
        else this._params.push([name, String(value)]);
    }
    append(name, value) { this._params.push([String(name), String(value)]); }
    delete(name) { this._params = this._params.filter(([k]) => k !== name); }
    toString() {
        return this._params.map(([k, v]) => encodeURIComponent(k) + '=' + encodeURIComponent(v)).join('&');
    }
    forEach(cb) { this._params.forEach(([k, v]) => cb(v, k, this)); }
    entries() { return this._params[Symbol.iterator](); }
    [Symbol.iterator]() { return this.entries(); }
}

// Collapse "." and ".." segments of an absolute path
function normalizePath(path) {
    const out = [];
    for (const segment of path.split('/').slice(1)) {
        if (segment === '..') out.pop();
        else if (segment !== '.') out.push(segment);
    }
    return '/' + out.join('/');
}

// URL polyfill - path and string handling, not full WHATWG parsing
class URL {
    constructor(url, base) {
        if (typeof url !== 'string') url = String(url);
        let fullUrl = url;

        // Resolve relative URLs against base
        if (base !== undefined) {
            const b = typeof base === 'string' ? base : String(base);
            if (/^[a-z][a-z0-9+.-]*:/i.test(url)) {
                fullUrl = url;
            } else if (url.startsWith('//')) {
                const proto = b.match(/^([a-z][a-z0-9+.-]*:)/i);
                fullUrl = (proto ? proto[1] : 'https:') + url;
            } else if (url.startsWith('/')) {
                const origin = b.match(/^([a-z][a-z0-9+.-]*:\/\/[^/?#]*)/i);
                fullUrl = (origin ? origin[1] : '') + url;
            } else if (url.startsWith('?')) {
                fullUrl = b.split('?')[0].split('#')[0] + url;
            } else if (url.startsWith('#')) {
                fullUrl = b.split('#')[0] + url;
            } else {
                const baseNoQuery = b.split('?')[0].split('#')[0];
                const lastSlash = baseNoQuery.lastIndexOf('/');
                fullUrl = baseNoQuery.slice(0, lastSlash + 1) + url;
            }
        } else if (!/^[a-z][a-z0-9+.-]*:/i.test(url)) {
            throw new TypeError('Invalid URL: ' + url);
        }

        const match = fullUrl.match(/^([a-z][a-z0-9+.-]*:)?(\/\/([^/?#]*))?([^?#]*)(\?[^#]*)?(#.*)?$/i);
        if (!match) throw new TypeError('Invalid URL: ' + url);

        this.protocol = (match[1] || '').toLowerCase();
        const authority = match[3] || '';
        let pathname = match[4] || '/';
        if (pathname.startsWith('/')) pathname = normalizePath(pathname);
        this.pathname = pathname;
        this.search = match[5] && match[5] !== '?' ? match[5] : '';
        this.hash = match[6] && match[6] !== '#' ? match[6] : '';

        const atIdx = authority.lastIndexOf('@');
        const hostPart = atIdx >= 0 ? authority.slice(atIdx + 1) : authority;
        const portMatch = hostPart.match(/:(\d+)$/);
        this.port = portMatch ? portMatch[1] : '';
        this.hostname = portMatch ? hostPart.slice(0, -portMatch[0].length) : hostPart;
        this.host = this.port ? this.hostname + ':' + this.port : this.hostname;
        this.origin = (this.protocol && this.host) ? this.protocol + '//' + this.host : 'null';
        this.username = '';
        this.password = '';
        if (atIdx >= 0) {
            const userInfo = authority.slice(0, atIdx);
            const colonIdx = userInfo.indexOf(':');
            this.username = colonIdx >= 0 ? userInfo.slice(0, colonIdx) : userInfo;
            this.password = colonIdx >= 0 ? userInfo.slice(colonIdx + 1) : '';
        }
        const hasAuthority = match[2] !== undefined;
        this.href = this.protocol + (hasAuthority ? '//' + authority : '') + this.pathname + this.search + this.hash;
        this.searchParams = new URLSearchParams(this.search);
    }

    toString() { return this.href; }
    toJSON() { return this.href; }
}

// WebAssembly facade: streaming entry points read the whole response first
function responseBuffer(source) {
    return Promise.resolve(source).then((response) => {
        if (!response || typeof response.arrayBuffer !== 'function') {
            throw new TypeError('WebAssembly: argument is not a Response');
        }
        if (response.ok === false) {
            throw new TypeError('WebAssembly: failed to load ' + response.url + ': ' + response.statusText);
        }
        return response.arrayBuffer();
    });
}

const wasm = Object.create(WebAssembly);
wasm.compileStreaming = (source) => responseBuffer(source).then((buffer) => WebAssembly.compile(buffer));
wasm.instantiateStreaming = (source, imports) =>
    responseBuffer(source).then((buffer) => WebAssembly.instantiate(buffer, imports));

// Timers on libuv
function setTimeout(fn, delay, ...args) {
    if (typeof fn !== 'function') return 0;
    return native.setTimer(() => fn(...args), Math.max(0, Number(delay) || 0), false);
}
function setInterval(fn, delay, ...args) {
    if (typeof fn !== 'function') return 0;
    return native.setTimer(() => fn(...args), Math.max(1, Number(delay) || 0), true);
}
function clearTimeout(id) {
    if (id) native.clearTimer(Number(id));
}
const clearInterval = clearTimeout;

function queueMicrotask(fn) {
    Promise.resolve().then(fn).catch(reportUncaught);
}

const performance = {
    timeOrigin: Date.now(),
    now: () => native.now(),
};

const crypto = {
    getRandomValues(view) {
        native.randomFill(view);
        return view;
    },
};

// Worker scope
const listeners = [];
const self = Object.create(globalThis);

function addEventListener(type, listener) {
    if (type === 'message' && typeof listener === 'function' && !listeners.includes(listener)) {
        listeners.push(listener);
    }
}

function removeEventListener(type, listener) {
    if (type !== 'message') return;
    const idx = listeners.indexOf(listener);
    if (idx >= 0) listeners.splice(idx, 1);
}

function isTerminal(data) {
    return data !== null && typeof data === 'object' && ('result' in data || 'error' in data);
}

function bytesReplacer(key, value) {
    if (value instanceof ArrayBuffer || ArrayBuffer.isView(value)) {
        return { $bytes: native.encodeBase64(value) };
    }
    if (value instanceof Error) {
        return String(value);
    }
    return value;
}

function bytesReviver(key, value) {
    if (value !== null && typeof value === 'object' && typeof value.$bytes === 'string' &&
        Object.keys(value).length === 1) {
        return new Uint8Array(native.decodeBase64(value.$bytes));
    }
    return value;
}

function postMessage(data) {
    let text;
    try {
        text = JSON.stringify(data === undefined ? null : data, bytesReplacer);
    } catch (err) {
        reportUncaught(err);
        return;
    }
    native.post(text === undefined ? 'null' : text, isTerminal(data));
}

function importScripts(...urls) {
    for (const url of urls) {
        native.importScript(String(url));
    }
}

const parsedLocation = new URL(kernelUrl);
const location = {
    href: parsedLocation.href,
    origin: parsedLocation.origin,
    protocol: parsedLocation.protocol,
    host: parsedLocation.host,
    hostname: parsedLocation.hostname,
    port: parsedLocation.port,
    pathname: parsedLocation.pathname,
    search: parsedLocation.search,
    hash: parsedLocation.hash,
    toString() { return this.href; },
};

// CommonJS stand-ins for the kernel's UMD footer
const module = { exports: {} };
function require(name) {
    throw new Error("Cannot find module '" + name + "'");
}

function deliver(text) {
    const data = JSON.parse(text, bytesReviver);
    const event = { type: 'message', data, target: self, currentTarget: self };
    const handlers = [];
    if (typeof self.onmessage === 'function') handlers.push(self.onmessage);
    handlers.push(...listeners);
    for (const handler of handlers) {
        Promise.resolve().then(() => handler.call(self, event)).catch(reportUncaught);
    }
}

Object.assign(self, {
    self, postMessage, addEventListener, removeEventListener, importScripts, location,
    fetch, Response, Headers, Blob, URL, URLSearchParams, TextEncoder, TextDecoder,
    WebAssembly: wasm, setTimeout, clearTimeout, setInterval, clearInterval,
    queueMicrotask, performance, crypto, name: '',
});

return {
    self, postMessage, addEventListener, removeEventListener, importScripts, location,
    fetch, Response, Headers, Blob, URL, URLSearchParams, TextEncoder, TextDecoder,
    WebAssembly: wasm, setTimeout, clearTimeout, setInterval, clearInterval,
    queueMicrotask, performance, crypto, module, exports: module.exports, require,
    deliver,
};
})
)JS";

} // anonymous namespace

WorkerEnvironment::WorkerEnvironment(js::Engine& engine,
                                     async::EventLoop& loop,
                                     const assets::AssetResolver& resolver,
                                     MessagePort& port,
                                     EnvironmentOptions options)
    : engine_(engine),
      loop_(loop),
      resolver_(resolver),
      port_(port),
      options_(std::move(options)),
      reader_(loop, resolver) {}

WorkerEnvironment::~WorkerEnvironment() {
    shutdown();
}

bool WorkerEnvironment::install(std::string& error) {
    if (installed_) {
        return true;
    }

    js::JSValueHandle factory = engine_.evalScriptWithResult(kEnvironmentSource, "worker-environment.js");
    if (!factory.ptr) {
        error = "Environment bootstrap failed: " + engine_.getException();
        return false;
    }

    js::JSValueHandle natives = engine_.newObject();
    installNatives(natives);

    js::JSValueHandle kernelUrl = engine_.newString(options_.kernelUrl);
    js::JSValueHandle env = engine_.call(factory, engine_.newUndefined(), {natives, kernelUrl});
    engine_.unprotect(kernelUrl);
    engine_.unprotect(natives);
    engine_.unprotect(factory);

    if (!env.ptr) {
        error = "Environment construction failed: " + engine_.getException();
        return false;
    }

    engine_.protect(env);
    env_ = env;
    installed_ = true;

    if (options_.verbose) {
        std::cout << "[Shim] Worker environment installed (location " << options_.kernelUrl << ")" << std::endl;
    }
    return true;
}

void WorkerEnvironment::installNatives(js::JSValueHandle natives) {
    auto addNative = [this, natives](const char* name, js::NativeFunction fn) {
        js::JSValueHandle func = engine_.newFunction(name, std::move(fn));
        engine_.setProperty(natives, name, func);
        engine_.unprotect(func);
    };

    // post(jsonText, isTerminal)
    addNative("post", [this](void*, const std::vector<js::JSValueHandle>& args) {
        if (args.empty()) {
            return engine_.newUndefined();
        }
        std::string text = engine_.toString(args[0]);
        bool terminal = args.size() > 1 && engine_.toBoolean(args[1]);
        if (options_.verbose) {
            std::cout << "[Shim] postMessage (" << text.size() << " bytes"
                      << (terminal ? ", terminal" : "") << ")" << std::endl;
        }
        port_.postPayloadJson(text);
        if (terminal) {
            terminalPosted_ = true;
        }
        return engine_.newUndefined();
    });

    addNative("reportError", [this](void*, const std::vector<js::JSValueHandle>& args) {
        reportFault(args.empty() ? "Unknown error" : engine_.toString(args[0]));
        return engine_.newUndefined();
    });

    // fetchAsset(url, callback(holder)) - callback runs on a later loop turn
    addNative("fetchAsset", [this](void*, const std::vector<js::JSValueHandle>& args) {
        if (args.size() < 2 || !engine_.isFunction(args[1])) {
            engine_.throwException("fetchAsset: expected (url, callback)");
            return engine_.newUndefined();
        }
        std::string url = engine_.toString(args[0]);
        js::JSValueHandle callback = args[1];
        engine_.protect(callback);

        reader_.lookup(url, [this, callback](assets::AssetLookup result) {
            js::JSValueHandle holder = wrapResponse(
                std::make_unique<assets::FileAssetResponse>(std::move(result)));
            js::JSValueHandle ret = engine_.call(callback, engine_.newUndefined(), {holder});
            if (!ret.ptr) {
                reportFault(engine_.getException());
            } else {
                engine_.unprotect(ret);
            }
            engine_.unprotect(holder);
            engine_.unprotect(callback);
        });
        return engine_.newUndefined();
    });

    addNative("responseInfo", [this](void*, const std::vector<js::JSValueHandle>& args) {
        assets::AssetResponse* response = args.empty() ? nullptr : unwrapResponse(args[0]);
        if (!response) {
            engine_.throwException("responseInfo: not an asset response");
            return engine_.newUndefined();
        }
        js::JSValueHandle info = engine_.newObject();
        auto set = [this, info](const char* name, js::JSValueHandle value) {
            engine_.setProperty(info, name, value);
            engine_.unprotect(value);
        };
        set("ok", engine_.newBoolean(response->ok()));
        set("status", engine_.newNumber(response->status()));
        set("statusText", engine_.newString(response->statusText()));
        set("url", engine_.newString(response->url()));
        set("size", engine_.newNumber(static_cast<double>(response->body().size())));
        return info;
    });

    addNative("responseBytes", [this](void*, const std::vector<js::JSValueHandle>& args) {
        assets::AssetResponse* response = args.empty() ? nullptr : unwrapResponse(args[0]);
        if (!response) {
            engine_.throwException("responseBytes: not an asset response");
            return engine_.newUndefined();
        }
        const auto& body = response->body();
        return engine_.newArrayBuffer(body.data(), body.size());
    });

    addNative("responseText", [this](void*, const std::vector<js::JSValueHandle>& args) {
        assets::AssetResponse* response = args.empty() ? nullptr : unwrapResponse(args[0]);
        if (!response) {
            engine_.throwException("responseText: not an asset response");
            return engine_.newUndefined();
        }
        return engine_.newString(response->text());
    });

    addNative("responseClone", [this](void*, const std::vector<js::JSValueHandle>& args) {
        assets::AssetResponse* response = args.empty() ? nullptr : unwrapResponse(args[0]);
        if (!response) {
            engine_.throwException("responseClone: not an asset response");
            return engine_.newUndefined();
        }
        return wrapResponse(response->clone());
    });

    // importScript(url) - synchronous, evaluated at global scope like a worker's importScripts
    addNative("importScript", [this](void*, const std::vector<js::JSValueHandle>& args) {
        std::string url = args.empty() ? "" : engine_.toString(args[0]);
        assets::AssetLookup lookup = resolver_.lookup(url);
        if (!lookup.found()) {
            std::string message = "importScripts: failed to load " + url;
            if (!lookup.error.empty()) {
                message += " (" + lookup.error + ")";
            }
            engine_.throwException(message.c_str());
            return engine_.newUndefined();
        }
        if (options_.verbose) {
            std::cout << "[Shim] importScripts " << lookup.path << std::endl;
        }
        std::string code(lookup.bytes.begin(), lookup.bytes.end());
        if (!engine_.evalScript(code, lookup.path)) {
            std::string message = "importScripts: " + url + ": " + engine_.getException();
            engine_.throwException(message.c_str());
        }
        return engine_.newUndefined();
    });

    // setTimer(callback, delayMs, repeat) -> id
    addNative("setTimer", [this](void*, const std::vector<js::JSValueHandle>& args) {
        if (args.empty() || !engine_.isFunction(args[0])) {
            return engine_.newNumber(0);
        }
        double delay = args.size() > 1 ? engine_.toNumber(args[1]) : 0;
        if (!(delay >= 0)) delay = 0;
        bool repeat = args.size() > 2 && engine_.toBoolean(args[2]);
        uint64_t delayMs = static_cast<uint64_t>(delay);
        int id = createTimer(args[0], delayMs, repeat ? std::max<uint64_t>(delayMs, 1) : 0);
        return engine_.newNumber(id);
    });

    addNative("clearTimer", [this](void*, const std::vector<js::JSValueHandle>& args) {
        if (!args.empty()) {
            cancelTimer(static_cast<int>(engine_.toNumber(args[0])));
        }
        return engine_.newUndefined();
    });

    addNative("encodeUtf8", [this](void*, const std::vector<js::JSValueHandle>& args) {
        std::string text = args.empty() ? "" : engine_.toString(args[0]);
        return engine_.createUint8Array(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    });

    addNative("decodeUtf8", [this](void*, const std::vector<js::JSValueHandle>& args) {
        size_t size = 0;
        const char* data = args.empty() ? nullptr
            : static_cast<const char*>(engine_.getArrayBufferData(args[0], &size));
        if (!data || size == 0) {
            return engine_.newString("");
        }
        // Skip a UTF-8 byte order mark, as TextDecoder does by default
        if (size >= 3 && static_cast<uint8_t>(data[0]) == 0xEF &&
            static_cast<uint8_t>(data[1]) == 0xBB && static_cast<uint8_t>(data[2]) == 0xBF) {
            data += 3;
            size -= 3;
        }
        return engine_.newString(std::string(data, size));
    });

    addNative("encodeBase64", [this](void*, const std::vector<js::JSValueHandle>& args) {
        size_t size = 0;
        const uint8_t* data = args.empty() ? nullptr
            : static_cast<const uint8_t*>(engine_.getArrayBufferData(args[0], &size));
        if (!data) {
            return engine_.newString("");
        }
        return engine_.newString(protocol::base64Encode(data, size));
    });

    addNative("decodeBase64", [this](void*, const std::vector<js::JSValueHandle>& args) {
        std::vector<uint8_t> bytes;
        std::string error;
        if (args.empty() || !protocol::base64Decode(engine_.toString(args[0]), bytes, error)) {
            engine_.throwException(("decodeBase64: " + error).c_str());
            return engine_.newUndefined();
        }
        return engine_.newArrayBuffer(bytes.data(), bytes.size());
    });

    uint64_t startNs = uv_hrtime();
    addNative("now", [this, startNs](void*, const std::vector<js::JSValueHandle>&) {
        return engine_.newNumber(static_cast<double>(uv_hrtime() - startNs) / 1e6);
    });

    addNative("randomFill", [this](void*, const std::vector<js::JSValueHandle>& args) {
        size_t size = 0;
        uint8_t* data = args.empty() ? nullptr
            : static_cast<uint8_t*>(engine_.getArrayBufferData(args[0], &size));
        if (data) {
            std::random_device device;
            std::uniform_int_distribution<int> byte(0, 255);
            for (size_t i = 0; i < size; i++) {
                data[i] = static_cast<uint8_t>(byte(device));
            }
        }
        return engine_.newUndefined();
    });
}

bool WorkerEnvironment::loadKernel(const std::string& source, const std::string& filename, std::string& error) {
    if (!installed_ && !install(error)) {
        return false;
    }

    std::string params;
    for (const char* name : kInjectedNames) {
        if (!params.empty()) params += ", ";
        params += name;
    }
    std::string wrapped = "(function(" + params + ") {\n" + source + "\n})";

    js::JSValueHandle fn = engine_.evalScriptWithResult(wrapped, filename);
    if (!fn.ptr) {
        error = "Kernel failed to compile: " + engine_.getException();
        reportFault(error);
        return false;
    }

    std::vector<js::JSValueHandle> args;
    for (const char* name : kInjectedNames) {
        args.push_back(engine_.getProperty(env_, name));
    }
    js::JSValueHandle self = args.front();

    js::JSValueHandle result = engine_.call(fn, self, args);
    for (auto& arg : args) {
        engine_.unprotect(arg);
    }
    engine_.unprotect(fn);

    if (!result.ptr) {
        error = "Kernel threw during load: " + engine_.getException();
        reportFault(error);
        return false;
    }
    engine_.unprotect(result);

    if (options_.verbose) {
        std::cout << "[Shim] Kernel loaded: " << filename << " (" << source.size() << " bytes)" << std::endl;
    }
    return true;
}

void WorkerEnvironment::deliver(const protocol::Envelope& envelope) {
    if (!installed_) {
        std::cerr << "[Shim] Message before install; dropped" << std::endl;
        return;
    }
    if (envelope.type != protocol::EnvelopeType::Message) {
        std::cerr << "[Shim] Ignoring non-message envelope from host" << std::endl;
        return;
    }

    js::JSValueHandle deliverFn = engine_.getProperty(env_, "deliver");
    js::JSValueHandle text = engine_.newString(protocol::writeJson(envelope.data));
    js::JSValueHandle result = engine_.call(deliverFn, env_, {text});
    if (!result.ptr) {
        reportFault(engine_.getException());
    } else {
        engine_.unprotect(result);
    }
    engine_.unprotect(text);
    engine_.unprotect(deliverFn);
}

bool WorkerEnvironment::processPending() {
    bool ran = reader_.processCompleted();
    if (runDueTimers()) {
        ran = true;
    }
    return ran;
}

void WorkerEnvironment::reportFault(const std::string& message) {
    std::cerr << "[Worker] Uncaught error: " << message << std::endl;
    if (terminalPosted_) {
        return;
    }
    faulted_ = true;
    terminalPosted_ = true;
    port_.postError(message);
}

js::JSValueHandle WorkerEnvironment::wrapResponse(std::unique_ptr<assets::AssetResponse> response) {
    js::JSValueHandle holder = engine_.newObject();
    engine_.setPrivateData(holder, response.get());
    responses_.push_back(std::move(response));
    return holder;
}

assets::AssetResponse* WorkerEnvironment::unwrapResponse(js::JSValueHandle holder) {
    void* data = engine_.getPrivateData(holder);
    if (!data) {
        return nullptr;
    }
    for (const auto& response : responses_) {
        if (response.get() == data) {
            return response.get();
        }
    }
    return nullptr;
}

// ============================================================================
// Timers
// ============================================================================

void WorkerEnvironment::onTimer(uv_timer_t* handle) {
    auto* ctx = static_cast<TimerContext*>(handle->data);
    if (!ctx || ctx->cancelled) return;

    // Queue the callback for processing outside the libuv callback
    ctx->env->pendingTimers_.push({ctx->id, ctx->callback, ctx->intervalMs});
}

void WorkerEnvironment::onTimerClose(uv_handle_t* handle) {
    auto* ctx = static_cast<TimerContext*>(handle->data);
    if (ctx && ctx->env) {
        ctx->env->timers_.erase(ctx->id);
    }
    delete ctx;
}

int WorkerEnvironment::createTimer(js::JSValueHandle callback, uint64_t delayMs, uint64_t intervalMs) {
    uv_loop_t* loop = loop_.handle();
    if (!loop) {
        std::cerr << "[Shim] EventLoop not available for timers" << std::endl;
        return 0;
    }

    int id = nextTimerId_++;

    auto* ctx = new TimerContext();
    ctx->id = id;
    ctx->callback = callback;
    ctx->intervalMs = intervalMs;
    ctx->cancelled = false;
    ctx->env = this;
    ctx->handle.data = ctx;

    int result = uv_timer_init(loop, &ctx->handle);
    if (result != 0) {
        std::cerr << "[Shim] Failed to init timer: " << uv_strerror(result) << std::endl;
        delete ctx;
        return 0;
    }

    engine_.protect(callback);
    timers_[id] = ctx;

    result = uv_timer_start(&ctx->handle, onTimer, delayMs, intervalMs);
    if (result != 0) {
        std::cerr << "[Shim] Failed to start timer: " << uv_strerror(result) << std::endl;
        closeTimer(ctx);
        return 0;
    }
    return id;
}

void WorkerEnvironment::closeTimer(TimerContext* ctx) {
    if (ctx->cancelled) return;
    ctx->cancelled = true;
    uv_timer_stop(&ctx->handle);
    engine_.unprotect(ctx->callback);
    // uv_close is async - onTimerClose erases from the map when done
    uv_close(reinterpret_cast<uv_handle_t*>(&ctx->handle), onTimerClose);
}

void WorkerEnvironment::cancelTimer(int id) {
    auto it = timers_.find(id);
    if (it == timers_.end() || it->second->cancelled) return;
    cancelledTimerIds_.insert(id);
    closeTimer(it->second);
}

bool WorkerEnvironment::runDueTimers() {
    std::queue<PendingTimer> toProcess;
    std::swap(toProcess, pendingTimers_);
    bool ran = !toProcess.empty();

    while (!toProcess.empty()) {
        PendingTimer pending = toProcess.front();
        toProcess.pop();

        // Cancelled while waiting in the queue
        if (cancelledTimerIds_.count(pending.id) > 0) {
            continue;
        }

        js::JSValueHandle result = engine_.call(pending.callback, engine_.newUndefined(), {});
        if (!result.ptr) {
            reportFault(engine_.getException());
        } else {
            engine_.unprotect(result);
        }

        // One-shot timers are done after their first run
        if (pending.intervalMs == 0) {
            auto it = timers_.find(pending.id);
            if (it != timers_.end()) {
                closeTimer(it->second);
            }
        }
    }

    // Ids are never reused, so forget cancellations once nothing is queued
    if (pendingTimers_.empty()) {
        cancelledTimerIds_.clear();
    }
    return ran;
}

void WorkerEnvironment::shutdown() {
    for (auto& entry : timers_) {
        closeTimer(entry.second);
    }
    while (!pendingTimers_.empty()) {
        pendingTimers_.pop();
    }
    if (installed_ && env_.ptr) {
        engine_.unprotect(env_);
        env_ = js::JSValueHandle();
    }
}

} // namespace shim
} // namespace scadhost
