export module Core;

// Re-export the core layer so users only need 'import Core;'
export import Core.Error;
export import Core.Logging;
export import :Handle;
